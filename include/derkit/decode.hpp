#pragma once

/**
 * @file decode.hpp
 * @brief Type-driven DER decoding
 *
 * The shape of a target type selects how it is decoded:
 *
 *   signed integer            INTEGER, sign-extended to the type's width
 *   ByteView                  OCTET STRING, aliasing the input buffer
 *   std::array<uint8_t, N>    OCTET STRING of exactly N bytes (copied)
 *   std::nullptr_t            NULL
 *   Value                     any single record, schema-less
 *   struct with der_fields()  SEQUENCE; std::optional members are OPTIONAL
 *   std::variant<A, B, ...>   CHOICE, alternatives tried in order
 *   std::vector<T>            SEQUENCE OF T
 *   type with der_decode()    custom routine, used instead of all of the above
 *
 * @example
 * ```cpp
 * struct AlgorithmIdentifier {
 *     derkit::Value algorithm;
 *     std::optional<derkit::Value> parameters;
 *
 *     static auto der_fields() {
 *         return derkit::fields(&AlgorithmIdentifier::algorithm,
 *                               &AlgorithmIdentifier::parameters);
 *     }
 * };
 *
 * auto result = derkit::decode<AlgorithmIdentifier>(bytes);
 * if (result.ok) {
 *     // result.value.algorithm.as_object_identifier() ...
 * }
 * ```
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "derkit/cursor.hpp"
#include "derkit/error.hpp"
#include "derkit/header.hpp"
#include "derkit/options.hpp"
#include "derkit/value.hpp"

namespace derkit {

// ============================================================================
// Decode Context
// ============================================================================

// Per-call state threaded through the recursion
struct DecodeContext {
    const DecodeOptions* options = &default_decode_options();
    size_t depth = 0;

    // Set when the identifier and length of the element about to be decoded
    // have already been consumed (IMPLICIT tagging); only its payload
    // remains in the cursor.
    std::optional<Header> value_only;

    DecodeContext() = default;
    explicit DecodeContext(const DecodeOptions& opts) : options(&opts) {}

    // Context for a child element of the current one
    DecodeContext nested() const {
        DecodeContext ctx(*options);
        ctx.depth = depth + 1;
        return ctx;
    }

    // Context for another reading of the same element (CHOICE alternatives)
    DecodeContext alternative() const {
        DecodeContext ctx = nested();
        ctx.value_only = value_only;
        return ctx;
    }

    DecodeContext with_value_only(const Header& header) const {
        DecodeContext ctx = nested();
        ctx.value_only = header;
        return ctx;
    }
};

// ============================================================================
// Shape Declarations
// ============================================================================

// Ordered member list of a SEQUENCE type, returned from T::der_fields()
template <typename... Members>
constexpr std::tuple<Members...> fields(Members... members) {
    return std::tuple<Members...>(members...);
}

template <typename T>
struct always_false : std::false_type {};

// Specialized below for every supported shape
template <typename T, typename Enable = void>
struct Decoder {
    static_assert(always_false<T>::value, "type has no DER decoding shape");
};

template <typename T>
DecodeResult<T> decode(Cursor& cursor, const DecodeContext& ctx);

namespace detail {

template <typename T, typename = void>
struct has_der_decode : std::false_type {};

template <typename T>
struct has_der_decode<T, std::void_t<decltype(T::der_decode(std::declval<Cursor&>(),
                                                            std::declval<const DecodeContext&>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_der_fields : std::false_type {};

template <typename T>
struct has_der_fields<T, std::void_t<decltype(T::der_fields())>> : std::true_type {};

// Read the next element, honoring value-only mode. `implied` is the
// universal tag number the target expects; in value-only mode the payload
// is interpreted as that type whatever the already-consumed tag was.
inline DecodeResult<Value> read_element(Cursor& cursor, const DecodeContext& ctx,
                                        std::optional<uint8_t> implied = std::nullopt) {
    if (!ctx.value_only) return parse_one(cursor);

    Header header = *ctx.value_only;
    if (implied) {
        header.tag.tag_class = TagClass::Universal;
        header.tag.number = *implied;
    }
    return read_value(cursor, header);
}

// Absolute offset of the first identifier octet of `value`
inline size_t element_offset(const Value& value) {
    return value.payload_offset() - value.header().encoded_size;
}

// Cursor over a constructed value's payload
inline Cursor payload_cursor(const Value& value) {
    return Cursor(value.bytes(), value.payload_offset());
}

// Cursor over the complete encoding (identifier, length, payload) of a
// value yielded by a ValueIterator
inline Cursor element_cursor(const Value& value) {
    const size_t header_size = value.header().encoded_size;
    ByteView encoding(value.bytes().data() - header_size, header_size + value.bytes().size());
    return Cursor(encoding, element_offset(value));
}

// ----------------------------------------------------------------------------
// SEQUENCE fields
// ----------------------------------------------------------------------------

template <typename F>
struct FieldDecoder {
    static bool decode(F& field, Cursor& cursor, const DecodeContext& ctx, ErrorCode& error,
                       size_t& offset) {
        auto result = derkit::decode<F>(cursor, ctx);
        if (!result) {
            error = result.error;
            offset = result.offset;
            return false;
        }
        field = std::move(result.value);
        return true;
    }
};

template <typename U>
struct FieldDecoder<std::optional<U>> {
    static bool decode(std::optional<U>& field, Cursor& cursor, const DecodeContext& ctx,
                       ErrorCode& error, size_t& offset) {
        const OptionalPolicy policy = ctx.options->optional_policy;
        if (policy == OptionalPolicy::MismatchOnly && cursor.at_end()) {
            field.reset();
            return true;
        }

        const size_t mark = cursor.position();
        auto result = derkit::decode<U>(cursor, ctx);
        if (result) {
            field = std::move(result.value);
            return true;
        }

        cursor.restore(mark);
        if (!is_recoverable(result.error, policy)) {
            error = result.error;
            offset = result.offset;
            return false;
        }
        field.reset();
        return true;
    }
};

template <typename T, typename Tuple, size_t... I>
bool decode_fields(T& out, const Tuple& members, Cursor& cursor, const DecodeContext& ctx,
                   ErrorCode& error, size_t& offset, std::index_sequence<I...>) {
    return (... && FieldDecoder<std::decay_t<decltype(out.*std::get<I>(members))>>::decode(
                       out.*std::get<I>(members), cursor, ctx, error, offset));
}

} // namespace detail

// ============================================================================
// Scalars
// ============================================================================

// INTEGER into a fixed-width signed type
template <typename T>
struct Decoder<T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value>> {
    static DecodeResult<T> decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::Integer);
        if (!element) return forward_failure<T>(element);

        auto integer = element.value.as_integer();
        if (!integer) return forward_failure<T>(integer);
        return integer.value.template to_fixed<T>(detail::element_offset(element.value));
    }
};

// OCTET STRING, borrowed from the input buffer
template <>
struct Decoder<ByteView> {
    static DecodeResult<ByteView> decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::OctetString);
        if (!element) return forward_failure<ByteView>(element);

        auto octets = element.value.as_octet_string();
        if (!octets) return forward_failure<ByteView>(octets);
        return success(octets.value.bytes);
    }
};

// OCTET STRING of exactly N bytes
template <size_t N>
struct Decoder<std::array<uint8_t, N>> {
    static DecodeResult<std::array<uint8_t, N>> decode(Cursor& cursor, const DecodeContext& ctx) {
        using Array = std::array<uint8_t, N>;
        const size_t start = cursor.offset();

        auto bytes = Decoder<ByteView>::decode(cursor, ctx);
        if (!bytes) return forward_failure<Array>(bytes);
        if (bytes.value.size() != N) return failure<Array>(ErrorCode::LengthMismatch, start);

        Array out{};
        if (N > 0) std::memcpy(out.data(), bytes.value.data(), N);
        return success(out);
    }
};

template <>
struct Decoder<std::nullptr_t> {
    static DecodeResult<std::nullptr_t> decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::Null);
        if (!element) return forward_failure<std::nullptr_t>(element);
        if (!element.value.is_null()) {
            return failure<std::nullptr_t>(ErrorCode::Cast, detail::element_offset(element.value));
        }
        return success(nullptr);
    }
};

// Any single record
template <>
struct Decoder<Value> {
    static DecodeResult<Value> decode(Cursor& cursor, const DecodeContext& ctx) {
        return detail::read_element(cursor, ctx);
    }
};

// ============================================================================
// Custom Shapes
// ============================================================================

template <typename T>
struct Decoder<T, std::enable_if_t<detail::has_der_decode<T>::value>> {
    static DecodeResult<T> decode(Cursor& cursor, const DecodeContext& ctx) {
        return T::der_decode(cursor, ctx);
    }
};

// ============================================================================
// SEQUENCE
// ============================================================================

template <typename T>
struct Decoder<T, std::enable_if_t<detail::has_der_fields<T>::value &&
                                   !detail::has_der_decode<T>::value>> {
    static DecodeResult<T> decode(Cursor& cursor, const DecodeContext& ctx) {
        auto element = detail::read_element(cursor, ctx, UniversalTag::Sequence);
        if (!element) return forward_failure<T>(element);

        auto sequence = element.value.as_sequence();
        if (!sequence) return forward_failure<T>(sequence);

        Cursor body = detail::payload_cursor(element.value);
        const auto members = T::der_fields();
        constexpr size_t count = std::tuple_size<std::decay_t<decltype(members)>>::value;

        T out{};
        ErrorCode error = ErrorCode::Truncated;
        size_t offset = 0;
        if (!detail::decode_fields(out, members, body, ctx.nested(), error, offset,
                                   std::make_index_sequence<count>{})) {
            return failure<T>(error, offset);
        }

        if (!body.at_end()) return failure<T>(ErrorCode::TrailingData, body.offset());
        return success(std::move(out));
    }
};

// ============================================================================
// CHOICE
// ============================================================================

template <typename... Alternatives>
struct Decoder<std::variant<Alternatives...>> {
    using Variant = std::variant<Alternatives...>;

    static DecodeResult<Variant> decode(Cursor& cursor, const DecodeContext& ctx) {
        return decode_alternatives(cursor, ctx, std::index_sequence_for<Alternatives...>{});
    }

private:
    template <size_t... I>
    static DecodeResult<Variant> decode_alternatives(Cursor& cursor, const DecodeContext& ctx,
                                                     std::index_sequence<I...>) {
        DecodeResult<Variant> result = failure<Variant>(ErrorCode::NoMatchingVariant, cursor.offset());
        static_cast<void>((... || try_alternative<I>(cursor, ctx, result)));
        return result;
    }

    // Returns true once `result` is final: a match, or an error that must propagate
    template <size_t I>
    static bool try_alternative(Cursor& cursor, const DecodeContext& ctx, DecodeResult<Variant>& result) {
        using Alternative = std::variant_alternative_t<I, Variant>;

        const size_t mark = cursor.position();
        auto attempt = derkit::decode<Alternative>(cursor, ctx.alternative());
        if (attempt) {
            result = success(Variant(std::in_place_index<I>, std::move(attempt.value)));
            return true;
        }

        cursor.restore(mark);
        if (!is_recoverable(attempt.error, ctx.options->optional_policy)) {
            result = forward_failure<Variant>(attempt);
            return true;
        }
        return false;
    }
};

// ============================================================================
// SEQUENCE OF / SET OF
// ============================================================================

namespace detail {

// Decode every element of a SEQUENCE or SET payload as T. Each value the
// iterator yields is re-read through T's own decoder over exactly that
// value's encoding.
template <typename T>
DecodeResult<std::vector<T>> decode_elements(ValueIterator iterator, const DecodeContext& ctx) {
    using Elements = std::vector<T>;

    Elements out;
    while (true) {
        auto next = iterator.next();
        if (!next) return forward_failure<Elements>(next);
        if (!next.value) break;

        Cursor element = element_cursor(*next.value);
        auto decoded = derkit::decode<T>(element, ctx);
        if (!decoded) return forward_failure<Elements>(decoded);
        if (!element.at_end()) return failure<Elements>(ErrorCode::TrailingData, element.offset());
        out.push_back(std::move(decoded.value));
    }
    return success(std::move(out));
}

} // namespace detail

template <typename T>
struct Decoder<std::vector<T>> {
    static DecodeResult<std::vector<T>> decode(Cursor& cursor, const DecodeContext& ctx) {
        using Elements = std::vector<T>;

        auto element = detail::read_element(cursor, ctx, UniversalTag::Sequence);
        if (!element) return forward_failure<Elements>(element);

        auto sequence = element.value.as_sequence();
        if (!sequence) return forward_failure<Elements>(sequence);

        return detail::decode_elements<T>(sequence.value.iterator(element.value.payload_offset()),
                                          ctx.nested());
    }
};

// ============================================================================
// Entry Points
// ============================================================================

/**
 * @brief Decode one element of type T at the cursor.
 *
 * On success the cursor is positioned after the element. On failure it is
 * restored to where the call began.
 */
template <typename T>
DecodeResult<T> decode(Cursor& cursor, const DecodeContext& ctx) {
    if (ctx.depth > ctx.options->max_depth) {
        return failure<T>(ErrorCode::DepthExceeded, cursor.offset());
    }

    const size_t mark = cursor.position();
    auto result = Decoder<T>::decode(cursor, ctx);
    if (!result) cursor.restore(mark);
    return result;
}

/**
 * @brief Decode a complete buffer holding exactly one encoding of T.
 *
 * Bytes left over after the element fail with ErrorCode::TrailingData.
 */
template <typename T>
DecodeResult<T> decode(ByteView buffer, const DecodeOptions& options = default_decode_options()) {
    Cursor cursor(buffer);
    DecodeContext ctx(options);

    auto result = decode<T>(cursor, ctx);
    if (!result) return result;
    if (!cursor.at_end()) return failure<T>(ErrorCode::TrailingData, cursor.offset());
    return result;
}

} // namespace derkit
