#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "derkit/cursor.hpp"
#include "derkit/error.hpp"
#include "derkit/header.hpp"

namespace derkit {

class ValueIterator;

// ============================================================================
// Primitive views
// ============================================================================

// All views borrow their bytes from the buffer the value was decoded from.

struct Integer {
    ByteView bytes;  // big-endian two's complement content octets

    /**
     * @brief Reconstruct the integer into a fixed-width signed type.
     *
     * Fails with ErrorCode::TooBig when the encoding is wider than IntT.
     * Negative encodings are sign-extended from their encoded width.
     */
    template <typename IntT>
    DecodeResult<IntT> to_fixed(size_t offset = 0) const {
        static_assert(std::is_integral<IntT>::value && std::is_signed<IntT>::value,
                      "INTEGER targets must be signed integral types");
        if (bytes.size() > sizeof(IntT)) return failure<IntT>(ErrorCode::TooBig, offset);
        if (bytes.empty()) return failure<IntT>(ErrorCode::Truncated, offset);

        uint64_t raw = 0;
        for (uint8_t b : bytes) {
            raw = (raw << 8) | b;
        }
        const size_t encoded_bits = bytes.size() * 8;
        if ((bytes[0] & 0x80) != 0 && encoded_bits < 64) {
            raw |= ~uint64_t{0} << encoded_bits;
        }
        return success(static_cast<IntT>(static_cast<int64_t>(raw)));
    }
};

struct BitString {
    ByteView bytes;  // first octet is the unused-bit count

    uint8_t unused_bits() const { return bytes.empty() ? 0 : bytes[0]; }

    // Bit content without the leading count octet
    ByteView string() const { return bytes.size() <= 1 ? ByteView() : bytes.subview(1); }
};

struct OctetString {
    ByteView bytes;
};

struct ObjectIdentifier {
    ByteView bytes;

    // Decoded arcs; the first octet expands into two arcs. `offset` is the
    // absolute offset of the payload, used for failure offsets.
    DecodeResult<std::vector<uint64_t>> arcs(size_t offset = 0) const;

    // Dotted notation, e.g. "1.2.840.113549.1.1.1"
    DecodeResult<std::string> to_string(size_t offset = 0) const;
};

struct Sequence {
    ByteView bytes;
    ValueIterator iterator(size_t base_offset = 0) const;
};

struct Set {
    ByteView bytes;
    ValueIterator iterator(size_t base_offset = 0) const;
};

struct Null {};

struct Custom {
    Tag tag;
    ByteView bytes;
};

// ============================================================================
// Value
// ============================================================================

enum class ValueKind {
    Integer,
    BitString,
    OctetString,
    Null,
    ObjectIdentifier,
    Sequence,
    Set,
    Custom,
};

const char* value_kind_to_string(ValueKind kind);

/**
 * @brief One decoded TLV record.
 *
 * Universal-class tags with a dedicated variant map onto it; every other tag
 * is kept as Custom with its full Tag. Accessors fail with ErrorCode::Cast
 * when the held variant differs.
 */
class Value {
public:
    using Storage = std::variant<Null, Integer, BitString, OctetString, ObjectIdentifier,
                                 Sequence, Set, Custom>;

    Value() = default;
    Value(Header header, ByteView payload, size_t payload_offset);

    ValueKind kind() const;
    const Tag& tag() const { return header_.tag; }
    const Header& header() const { return header_; }
    ByteView bytes() const { return payload_; }

    // Absolute offset of the payload in the root buffer
    size_t payload_offset() const { return payload_offset_; }

    bool is_null() const { return std::holds_alternative<Null>(storage_); }

    DecodeResult<Integer> as_integer() const { return as<Integer>(); }
    DecodeResult<BitString> as_bit_string() const { return as<BitString>(); }
    DecodeResult<OctetString> as_octet_string() const { return as<OctetString>(); }
    DecodeResult<ObjectIdentifier> as_object_identifier() const { return as<ObjectIdentifier>(); }
    DecodeResult<Sequence> as_sequence() const { return as<Sequence>(); }
    DecodeResult<Set> as_set() const { return as<Set>(); }
    DecodeResult<Custom> as_custom() const { return as<Custom>(); }

private:
    template <typename V>
    DecodeResult<V> as() const {
        if (const auto* v = std::get_if<V>(&storage_)) return success(*v);
        return failure<V>(ErrorCode::Cast, payload_offset_ - header_.encoded_size);
    }

    Storage storage_;
    Header header_;
    ByteView payload_;
    size_t payload_offset_ = 0;
};

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b) { return !(a == b); }

// Decode one complete TLV record. On failure the cursor is left where it was.
DecodeResult<Value> parse_one(Cursor& cursor);

// Value-only mode: the header has already been consumed by the caller, only
// the payload bytes are read from the cursor.
DecodeResult<Value> read_value(Cursor& cursor, const Header& header);

// ============================================================================
// ValueIterator
// ============================================================================

/**
 * @brief Lazy single-pass iteration over a SEQUENCE or SET payload.
 *
 * next() yields one Value per call and an empty optional once the payload
 * is exhausted. Construct a new iterator to scan the payload again.
 */
class ValueIterator {
public:
    explicit ValueIterator(ByteView payload, size_t base_offset = 0)
        : cursor_(payload, base_offset) {}

    DecodeResult<std::optional<Value>> next();

    // Bytes of the payload consumed so far
    size_t consumed() const { return cursor_.position(); }

private:
    Cursor cursor_;
};

} // namespace derkit
