#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "derkit/decode.hpp"

namespace derkit {

namespace detail {

inline bool is_context_tag(const Tag& tag, uint8_t number) {
    return tag.tag_class == TagClass::ContextSpecific && tag.number == number;
}

} // namespace detail

// ============================================================================
// EXPLICIT [N] T
// ============================================================================

// Context-specific constructed tag wrapping exactly one encoding of T, e.g.
// the `[0] EXPLICIT Version` of an X.509 TBSCertificate.
template <uint8_t N, typename T>
struct Explicit {
    static_assert(N < HIGH_TAG_NUMBER, "high tag numbers are not supported");

    T value{};

    static DecodeResult<Explicit> der_decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx);
        if (!element) return forward_failure<Explicit>(element);

        const Tag& tag = element.value.tag();
        if (!detail::is_context_tag(tag, N) || !tag.constructed) {
            return failure<Explicit>(ErrorCode::UnexpectedTag, detail::element_offset(element.value));
        }

        Cursor inner = detail::payload_cursor(element.value);
        auto decoded = derkit::decode<T>(inner, ctx.nested());
        if (!decoded) return forward_failure<Explicit>(decoded);
        if (!inner.at_end()) return failure<Explicit>(ErrorCode::TrailingData, inner.offset());

        return success(Explicit{std::move(decoded.value)});
    }
};

// ============================================================================
// IMPLICIT [N] T
// ============================================================================

// Context-specific tag replacing T's own tag. The header is consumed here
// and T decodes the payload in value-only mode.
template <uint8_t N, typename T>
struct Implicit {
    static_assert(N < HIGH_TAG_NUMBER, "high tag numbers are not supported");

    T value{};

    static DecodeResult<Implicit> der_decode(Cursor& cursor, const DecodeContext& ctx) {
        const size_t start = cursor.offset();

        Header header;
        if (ctx.value_only) {
            header = *ctx.value_only;
        } else {
            auto read = read_header(cursor);
            if (!read) return forward_failure<Implicit>(read);
            header = read.value;
        }

        if (!detail::is_context_tag(header.tag, N)) {
            return failure<Implicit>(ErrorCode::UnexpectedTag, start);
        }

        auto decoded = derkit::decode<T>(cursor, ctx.with_value_only(header));
        if (!decoded) return forward_failure<Implicit>(decoded);
        return success(Implicit{std::move(decoded.value)});
    }
};

// ============================================================================
// OCTET STRING containing DER
// ============================================================================

// OCTET STRING whose payload is exactly one encoding of T, as in the
// privateKey field of a PKCS#8 PrivateKeyInfo.
template <typename T>
struct NestedOctetString {
    T value{};

    static DecodeResult<NestedOctetString> der_decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::OctetString);
        if (!element) return forward_failure<NestedOctetString>(element);

        auto octets = element.value.as_octet_string();
        if (!octets) return forward_failure<NestedOctetString>(octets);

        Cursor inner = detail::payload_cursor(element.value);
        auto decoded = derkit::decode<T>(inner, ctx.nested());
        if (!decoded) return forward_failure<NestedOctetString>(decoded);
        if (!inner.at_end()) return failure<NestedOctetString>(ErrorCode::TrailingData, inner.offset());

        return success(NestedOctetString{std::move(decoded.value)});
    }
};

// ============================================================================
// SET OF T
// ============================================================================

template <typename T>
struct SetOf {
    std::vector<T> elements;

    static DecodeResult<SetOf> der_decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::Set);
        if (!element) return forward_failure<SetOf>(element);

        auto set = element.value.as_set();
        if (!set) return forward_failure<SetOf>(set);

        auto decoded =
            detail::decode_elements<T>(set.value.iterator(element.value.payload_offset()), ctx.nested());
        if (!decoded) return forward_failure<SetOf>(decoded);
        return success(SetOf{std::move(decoded.value)});
    }
};

} // namespace derkit
