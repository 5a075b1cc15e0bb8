#include "derkit/header.hpp"

namespace derkit {

namespace {

constexpr uint8_t LONG_FORM_BIT = 0x80;
constexpr uint8_t INDEFINITE_LENGTH = 0x80;

DecodeResult<size_t> read_length(Cursor& cursor) {
    const size_t start = cursor.offset();
    auto first = cursor.read_byte();
    if (!first) return forward_failure<size_t>(first);

    const uint8_t octet = first.value;
    if ((octet & LONG_FORM_BIT) == 0) {
        return success(static_cast<size_t>(octet));
    }
    if (octet == INDEFINITE_LENGTH) {
        return failure<size_t>(ErrorCode::IndefiniteLength, start);
    }

    // 0xFF (reserved) lands here too: 127 octets never fit
    const size_t count = octet & 0x7F;
    if (count > sizeof(size_t)) {
        return failure<size_t>(ErrorCode::LengthTooLarge, start);
    }

    size_t length = 0;
    for (size_t i = 0; i < count; ++i) {
        auto b = cursor.read_byte();
        if (!b) return forward_failure<size_t>(b);
        length = (length << 8) | b.value;
    }
    return success(length);
}

} // namespace

DecodeResult<Header> read_header(Cursor& cursor) {
    const size_t mark = cursor.position();
    const size_t start = cursor.offset();

    auto identifier = cursor.read_byte();
    if (!identifier) return forward_failure<Header>(identifier);

    Header header;
    header.tag = Tag::from_identifier(identifier.value);
    if (header.tag.number == HIGH_TAG_NUMBER) {
        cursor.restore(mark);
        return failure<Header>(ErrorCode::UnsupportedHighTagNumber, start);
    }

    auto length = read_length(cursor);
    if (!length) {
        cursor.restore(mark);
        return forward_failure<Header>(length);
    }

    header.length = length.value;
    header.encoded_size = cursor.position() - mark;
    return success(header);
}

} // namespace derkit
