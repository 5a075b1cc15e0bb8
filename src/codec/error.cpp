#include "derkit/error.hpp"

#include <algorithm>
#include <cctype>

namespace derkit {

std::optional<ErrorCode> parse_error_code(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const ErrorCode all[] = {
        ErrorCode::Truncated,
        ErrorCode::UnsupportedHighTagNumber,
        ErrorCode::IndefiniteLength,
        ErrorCode::LengthTooLarge,
        ErrorCode::Cast,
        ErrorCode::LengthMismatch,
        ErrorCode::TooBig,
        ErrorCode::TrailingData,
        ErrorCode::NoMatchingVariant,
        ErrorCode::UnexpectedTag,
        ErrorCode::DepthExceeded,
        ErrorCode::InvalidObjectIdentifier,
    };
    for (ErrorCode e : all) {
        if (lower == error_code_to_string(e)) return e;
    }
    return std::nullopt;
}

} // namespace derkit
