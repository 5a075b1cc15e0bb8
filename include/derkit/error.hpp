#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace derkit {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Truncated,                 // buffer exhausted before an expected read
    UnsupportedHighTagNumber,  // tag number 31 (high-tag-number form)
    IndefiniteLength,          // length octet 0x80
    LengthTooLarge,            // long-form length wider than size_t
    Cast,                      // Value variant mismatch
    LengthMismatch,            // fixed-size byte string of the wrong length
    TooBig,                    // integer encoding wider than the target width
    TrailingData,              // SEQUENCE payload not fully consumed
    NoMatchingVariant,         // no CHOICE alternative matched
    UnexpectedTag,             // tagged wrapper saw a different tag
    DepthExceeded,             // nesting deeper than DecodeOptions::max_depth
    InvalidObjectIdentifier,   // malformed OID arc encoding
};

// Convert error code to canonical lowercase snake_case string
inline const char* error_code_to_string(ErrorCode e) {
    switch (e) {
        case ErrorCode::Truncated: return "truncated";
        case ErrorCode::UnsupportedHighTagNumber: return "unsupported_high_tag_number";
        case ErrorCode::IndefiniteLength: return "indefinite_length";
        case ErrorCode::LengthTooLarge: return "length_too_large";
        case ErrorCode::Cast: return "cast";
        case ErrorCode::LengthMismatch: return "length_mismatch";
        case ErrorCode::TooBig: return "too_big";
        case ErrorCode::TrailingData: return "trailing_data";
        case ErrorCode::NoMatchingVariant: return "no_matching_variant";
        case ErrorCode::UnexpectedTag: return "unexpected_tag";
        case ErrorCode::DepthExceeded: return "depth_exceeded";
        case ErrorCode::InvalidObjectIdentifier: return "invalid_object_identifier";
        default: return "unknown";
    }
}

// Parse error key string to enum (case-insensitive)
std::optional<ErrorCode> parse_error_code(const std::string& key);

// ============================================================================
// Decode Result
// ============================================================================

/**
 * @brief Outcome of a decode step.
 *
 * On success `ok` is true and `value` holds the decoded value. On failure
 * `error` names the failure and `offset` is the absolute position in the
 * root buffer where it was detected. Values returned by the decoder borrow
 * from the input buffer; keep the buffer alive while they are in use.
 */
template <typename T>
struct DecodeResult {
    bool ok = false;
    T value{};
    ErrorCode error = ErrorCode::Truncated;
    size_t offset = 0;

    explicit operator bool() const { return ok; }

    std::string error_string() const {
        return std::string(error_code_to_string(error)) + " at offset " + std::to_string(offset);
    }
};

template <typename T>
DecodeResult<T> success(T value) {
    DecodeResult<T> result;
    result.ok = true;
    result.value = std::move(value);
    return result;
}

template <typename T>
DecodeResult<T> failure(ErrorCode error, size_t offset) {
    DecodeResult<T> result;
    result.error = error;
    result.offset = offset;
    return result;
}

// Re-type a failed result so it can be returned from a caller with a different value type
template <typename T, typename U>
DecodeResult<T> forward_failure(const DecodeResult<U>& failed) {
    return failure<T>(failed.error, failed.offset);
}

} // namespace derkit
