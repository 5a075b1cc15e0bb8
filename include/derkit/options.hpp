#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "derkit/error.hpp"

namespace derkit {

// ============================================================================
// Optional Field / CHOICE Rollback Policy
// ============================================================================

enum class OptionalPolicy {
    CatchAll,      // any failure of a trial decode means "absent" / "try next"
    MismatchOnly,  // only tag/variant mismatches do; corruption propagates
};

inline const char* optional_policy_to_string(OptionalPolicy p) {
    switch (p) {
        case OptionalPolicy::CatchAll: return "catch_all";
        case OptionalPolicy::MismatchOnly: return "mismatch_only";
        default: return "catch_all";
    }
}

std::optional<OptionalPolicy> parse_optional_policy(const std::string& s);

// True if a failed trial decode may be rolled back and treated as absence
bool is_recoverable(ErrorCode error, OptionalPolicy policy);

// ============================================================================
// Decode Options
// ============================================================================

constexpr size_t DEFAULT_MAX_DEPTH = 64;

struct DecodeOptions {
    size_t max_depth = DEFAULT_MAX_DEPTH;
    OptionalPolicy optional_policy = OptionalPolicy::CatchAll;
};

// Shared instance used when a caller does not supply options
const DecodeOptions& default_decode_options();

// ============================================================================
// Options Parsing
// ============================================================================

struct DecodeOptionsParseResult {
    bool ok = false;
    std::string error;
    DecodeOptions options;
    std::vector<std::string> warnings;
};

// Parse options from JSON:
//   { "$schema": "derkit.decode.options.v1", "max_depth": 32,
//     "optional_policy": "mismatch_only" }
// "$schema" may be omitted. Unknown keys and invalid values are reported as
// invalid_configuration warnings and leave the default in place.
DecodeOptionsParseResult parse_decode_options(const std::string& json_str);

} // namespace derkit
