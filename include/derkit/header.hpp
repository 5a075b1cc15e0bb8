#pragma once

#include <cstddef>
#include <cstdint>

#include "derkit/cursor.hpp"
#include "derkit/error.hpp"

namespace derkit {

// ============================================================================
// Tags (X.690 8.1.2)
// ============================================================================

enum class TagClass : uint8_t {
    Universal = 0,
    Application = 1,
    ContextSpecific = 2,
    Private = 3,
};

inline const char* tag_class_to_string(TagClass c) {
    switch (c) {
        case TagClass::Universal: return "universal";
        case TagClass::Application: return "application";
        case TagClass::ContextSpecific: return "context";
        case TagClass::Private: return "private";
        default: return "unknown";
    }
}

// Universal tag numbers with a dedicated Value variant
namespace UniversalTag {
constexpr uint8_t Integer = 2;
constexpr uint8_t BitString = 3;
constexpr uint8_t OctetString = 4;
constexpr uint8_t Null = 5;
constexpr uint8_t ObjectIdentifier = 6;
constexpr uint8_t Sequence = 16;
constexpr uint8_t Set = 17;
} // namespace UniversalTag

// Tag number reserved for the (unsupported) high-tag-number form
constexpr uint8_t HIGH_TAG_NUMBER = 0x1F;

struct Tag {
    TagClass tag_class = TagClass::Universal;
    bool constructed = false;
    uint8_t number = 0;  // 0..30

    static Tag from_identifier(uint8_t octet) {
        Tag tag;
        tag.tag_class = static_cast<TagClass>(octet >> 6);
        tag.constructed = (octet & 0x20) != 0;
        tag.number = static_cast<uint8_t>(octet & 0x1F);
        return tag;
    }

    uint8_t identifier_octet() const {
        return static_cast<uint8_t>((static_cast<uint8_t>(tag_class) << 6) |
                                    (constructed ? 0x20 : 0x00) | number);
    }

    bool is_universal(uint8_t n) const {
        return tag_class == TagClass::Universal && number == n;
    }
};

inline bool operator==(const Tag& a, const Tag& b) {
    return a.tag_class == b.tag_class && a.constructed == b.constructed && a.number == b.number;
}
inline bool operator!=(const Tag& a, const Tag& b) { return !(a == b); }

// ============================================================================
// Header
// ============================================================================

struct Header {
    Tag tag;
    size_t length = 0;        // octet count of the payload that follows
    size_t encoded_size = 0;  // identifier + length octets consumed
};

// Decode one identifier octet and its length octets. On failure the cursor
// is left where it was. Supports short and long definite-length forms only.
DecodeResult<Header> read_header(Cursor& cursor);

} // namespace derkit
