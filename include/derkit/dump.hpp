#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "derkit/cursor.hpp"
#include "derkit/error.hpp"
#include "derkit/header.hpp"
#include "derkit/options.hpp"
#include "derkit/value.hpp"

namespace derkit {

// ============================================================================
// Structure Dump
// ============================================================================

struct DumpOptions {
    size_t max_depth = DEFAULT_MAX_DEPTH;

    // Try to parse OCTET STRING and BIT STRING payloads as nested DER and
    // show them as children when the whole payload parses.
    bool expand_encapsulated = false;
};

struct DumpNode {
    size_t offset = 0;       // absolute offset of the identifier octet
    size_t header_size = 0;
    size_t length = 0;
    Tag tag;
    ValueKind kind = ValueKind::Custom;
    std::string text;        // rendered primitive content, empty for containers
    bool encapsulated = false;
    std::vector<DumpNode> children;
};

struct DumpResult {
    bool ok = false;
    std::string error;
    std::optional<ErrorCode> error_code;
    size_t error_offset = 0;
    std::vector<DumpNode> nodes;
};

// Walk every record in `buffer` without a target shape
DumpResult dump_der(ByteView buffer, const DumpOptions& options = {});

nlohmann::json dump_to_json(const DumpResult& result);

// Indented listing, one record per line:
//    0: 30 len=13 sequence
//    2:   02 len=1 integer 5
std::string dump_to_text(const DumpResult& result);

} // namespace derkit
