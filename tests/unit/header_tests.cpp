#include <doctest/doctest.h>
#include <derkit/header.hpp>

#include <vector>

using derkit::Cursor;
using derkit::ErrorCode;
using derkit::Tag;
using derkit::TagClass;
using derkit::read_header;

// ============================================================================
// Identifier octet
// ============================================================================

TEST_CASE("read_header decodes a universal primitive tag") {
    std::vector<uint8_t> data = {0x02, 0x01, 0x05};
    Cursor cursor(data);

    auto header = read_header(cursor);
    REQUIRE(header.ok);
    CHECK(header.value.tag.tag_class == TagClass::Universal);
    CHECK_FALSE(header.value.tag.constructed);
    CHECK(header.value.tag.number == 2);
    CHECK(header.value.length == 1);
    CHECK(header.value.encoded_size == 2);
    CHECK(cursor.position() == 2);
}

TEST_CASE("read_header decodes class and constructed bits") {
    std::vector<uint8_t> data = {0xA3, 0x00};
    Cursor cursor(data);

    auto header = read_header(cursor);
    REQUIRE(header.ok);
    CHECK(header.value.tag.tag_class == TagClass::ContextSpecific);
    CHECK(header.value.tag.constructed);
    CHECK(header.value.tag.number == 3);
    CHECK(header.value.length == 0);
}

TEST_CASE("Tag identifier octet round trips") {
    for (int octet : {0x02, 0x30, 0x31, 0x5E, 0x80, 0xA0, 0xC1, 0xFE}) {
        auto tag = Tag::from_identifier(static_cast<uint8_t>(octet));
        CHECK(tag.identifier_octet() == octet);
    }
    CHECK(Tag::from_identifier(0x30).is_universal(16));
    CHECK_FALSE(Tag::from_identifier(0xB0).is_universal(16));
}

TEST_CASE("read_header rejects the high-tag-number form") {
    for (uint8_t identifier : {uint8_t{0x1F}, uint8_t{0xBF}, uint8_t{0x3F}}) {
        std::vector<uint8_t> data = {identifier, 0x81, 0x01};
        Cursor cursor(data);

        auto header = read_header(cursor);
        CHECK_FALSE(header.ok);
        CHECK(header.error == ErrorCode::UnsupportedHighTagNumber);
        CHECK(header.offset == 0);
        CHECK(cursor.position() == 0);
    }
}

// ============================================================================
// Length octets
// ============================================================================

TEST_CASE("read_header decodes short-form lengths up to 127") {
    std::vector<uint8_t> data = {0x04, 0x7F};
    Cursor cursor(data);

    auto header = read_header(cursor);
    REQUIRE(header.ok);
    CHECK(header.value.length == 127);
}

TEST_CASE("read_header decodes long-form lengths big-endian") {
    SUBCASE("one length octet") {
        std::vector<uint8_t> data = {0x04, 0x81, 0x80};
        Cursor cursor(data);
        auto header = read_header(cursor);
        REQUIRE(header.ok);
        CHECK(header.value.length == 128);
        CHECK(header.value.encoded_size == 3);
    }
    SUBCASE("two length octets") {
        std::vector<uint8_t> data = {0x30, 0x82, 0x01, 0x00};
        Cursor cursor(data);
        auto header = read_header(cursor);
        REQUIRE(header.ok);
        CHECK(header.value.length == 256);
        CHECK(header.value.encoded_size == 4);
    }
    SUBCASE("as many octets as size_t holds") {
        std::vector<uint8_t> data = {0x04, static_cast<uint8_t>(0x80 | sizeof(size_t))};
        for (size_t i = 0; i + 1 < sizeof(size_t); ++i) data.push_back(0x00);
        data.push_back(0x2A);
        Cursor cursor(data);
        auto header = read_header(cursor);
        REQUIRE(header.ok);
        CHECK(header.value.length == 42);
    }
}

TEST_CASE("read_header rejects indefinite length") {
    std::vector<uint8_t> data = {0x30, 0x80, 0x02, 0x01, 0x00, 0x00, 0x00};
    Cursor cursor(data);

    auto header = read_header(cursor);
    CHECK_FALSE(header.ok);
    CHECK(header.error == ErrorCode::IndefiniteLength);
    CHECK(header.offset == 1);
    CHECK(cursor.position() == 0);
}

TEST_CASE("read_header fails LengthTooLarge and leaves the cursor untouched") {
    std::vector<uint8_t> data = {0x04, static_cast<uint8_t>(0x80 | (sizeof(size_t) + 1))};
    for (size_t i = 0; i < sizeof(size_t) + 1; ++i) data.push_back(0x01);
    Cursor cursor(data);

    auto header = read_header(cursor);
    CHECK_FALSE(header.ok);
    CHECK(header.error == ErrorCode::LengthTooLarge);
    CHECK(cursor.position() == 0);

    // A follow-up read sees the same bytes
    CHECK(cursor.read_byte().value == 0x04);
    CHECK(cursor.read_byte().value == data[1]);
}

TEST_CASE("read_header treats the reserved 0xFF length octet as too large") {
    std::vector<uint8_t> data = {0x04, 0xFF, 0x00};
    Cursor cursor(data);

    auto header = read_header(cursor);
    CHECK(header.error == ErrorCode::LengthTooLarge);
    CHECK(cursor.position() == 0);
}

TEST_CASE("read_header fails Truncated on missing octets") {
    SUBCASE("empty buffer") {
        std::vector<uint8_t> data;
        Cursor cursor(data);
        auto header = read_header(cursor);
        CHECK(header.error == ErrorCode::Truncated);
    }
    SUBCASE("missing length octet") {
        std::vector<uint8_t> data = {0x02};
        Cursor cursor(data);
        auto header = read_header(cursor);
        CHECK(header.error == ErrorCode::Truncated);
        CHECK(cursor.position() == 0);
    }
    SUBCASE("missing long-form length octets") {
        std::vector<uint8_t> data = {0x04, 0x82, 0x01};
        Cursor cursor(data);
        auto header = read_header(cursor);
        CHECK(header.error == ErrorCode::Truncated);
        CHECK(header.offset == 3);
        CHECK(cursor.position() == 0);
    }
}
