#include <doctest/doctest.h>
#include <derkit/dump.hpp>

#include <string>
#include <vector>

using namespace derkit;

// SEQUENCE { INTEGER 258, NULL, OCTET STRING "ab" }
static std::vector<uint8_t> simple_sequence() {
    return {0x30, 0x0A, 0x02, 0x02, 0x01, 0x02, 0x05, 0x00, 0x04, 0x02, 'a', 'b'};
}

TEST_CASE("dump_der builds a node tree with absolute offsets") {
    auto data = simple_sequence();
    auto result = dump_der(ByteView(data));

    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 1);

    const DumpNode& seq = result.nodes[0];
    CHECK(seq.offset == 0);
    CHECK(seq.header_size == 2);
    CHECK(seq.length == 10);
    CHECK(seq.kind == ValueKind::Sequence);
    CHECK(seq.text.empty());
    REQUIRE(seq.children.size() == 3);

    CHECK(seq.children[0].offset == 2);
    CHECK(seq.children[0].kind == ValueKind::Integer);
    CHECK(seq.children[0].text == "258");
    CHECK(seq.children[1].offset == 6);
    CHECK(seq.children[1].kind == ValueKind::Null);
    CHECK(seq.children[1].text.empty());
    CHECK(seq.children[2].offset == 8);
    CHECK(seq.children[2].text == "6162");
}

TEST_CASE("dump_der walks consecutive top-level records") {
    std::vector<uint8_t> data = {0x02, 0x01, 0xFF, 0x05, 0x00};
    auto result = dump_der(ByteView(data));
    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 2);
    CHECK(result.nodes[0].text == "-1");
    CHECK(result.nodes[1].offset == 3);

    auto empty = dump_der(ByteView());
    CHECK(empty.ok);
    CHECK(empty.nodes.empty());
}

TEST_CASE("dump_der renders primitive contents") {
    SUBCASE("object identifier") {
        std::vector<uint8_t> data = {0x06, 0x06, 0x2A, 0x86, 0x48, 0x86, 0xF7, 0x0D};
        auto result = dump_der(ByteView(data));
        REQUIRE(result.ok);
        CHECK(result.nodes[0].text == "1.2.840.113549");
    }
    SUBCASE("bit string") {
        std::vector<uint8_t> data = {0x03, 0x03, 0x04, 0xAB, 0xC0};
        auto result = dump_der(ByteView(data));
        REQUIRE(result.ok);
        CHECK(result.nodes[0].text == "unused=4 abc0");
    }
    SUBCASE("integer wider than 64 bits") {
        std::vector<uint8_t> data = {0x02, 0x09, 0x01, 0, 0, 0, 0, 0, 0, 0, 0};
        auto result = dump_der(ByteView(data));
        REQUIRE(result.ok);
        CHECK(result.nodes[0].text == "010000000000000000");
    }
    SUBCASE("long payload is cut short") {
        std::vector<uint8_t> data = {0x04, 0x28};
        data.resize(2 + 0x28, 0xEE);
        auto result = dump_der(ByteView(data));
        REQUIRE(result.ok);
        CHECK(result.nodes[0].text == std::string(64, 'e') + "...");
    }
}

TEST_CASE("dump_der descends into constructed context tags") {
    std::vector<uint8_t> data = {0xA0, 0x03, 0x02, 0x01, 0x02, 0x81, 0x01, 0x7F};
    auto result = dump_der(ByteView(data));
    REQUIRE(result.ok);
    REQUIRE(result.nodes.size() == 2);

    CHECK(result.nodes[0].kind == ValueKind::Custom);
    CHECK(result.nodes[0].tag.tag_class == TagClass::ContextSpecific);
    REQUIRE(result.nodes[0].children.size() == 1);
    CHECK(result.nodes[0].children[0].text == "2");

    // Primitive context tags stay opaque
    CHECK(result.nodes[1].children.empty());
    CHECK(result.nodes[1].text == "7f");
}

TEST_CASE("dump_der keeps the records read before an error") {
    std::vector<uint8_t> data = {0x30, 0x05, 0x02, 0x01, 0x05, 0x04, 0x09};
    auto result = dump_der(ByteView(data));

    CHECK_FALSE(result.ok);
    REQUIRE(result.error_code.has_value());
    CHECK(*result.error_code == ErrorCode::Truncated);
    CHECK(result.error_offset == 7);
    CHECK(result.error == "truncated at offset 7");

    REQUIRE(result.nodes.size() == 1);
    REQUIRE(result.nodes[0].children.size() == 1);
    CHECK(result.nodes[0].children[0].text == "5");
}

TEST_CASE("dump_der stops at max_depth") {
    std::vector<uint8_t> data = {0x30, 0x04, 0x30, 0x02, 0x30, 0x00};

    DumpOptions options;
    options.max_depth = 1;
    auto limited = dump_der(ByteView(data), options);
    CHECK_FALSE(limited.ok);
    CHECK(limited.error_code == ErrorCode::DepthExceeded);
    CHECK(limited.error_offset == 4);

    options.max_depth = 2;
    CHECK(dump_der(ByteView(data), options).ok);
}

TEST_CASE("dump_der expands encapsulated DER on request") {
    // OCTET STRING { SEQUENCE { INTEGER 7 } }, BIT STRING { SEQUENCE { INTEGER 7 } }
    std::vector<uint8_t> data = {0x04, 0x05, 0x30, 0x03, 0x02, 0x01, 0x07,
                                 0x03, 0x06, 0x00, 0x30, 0x03, 0x02, 0x01, 0x07};

    auto plain = dump_der(ByteView(data));
    REQUIRE(plain.ok);
    CHECK_FALSE(plain.nodes[0].encapsulated);
    CHECK(plain.nodes[0].text == "3003020107");

    DumpOptions options;
    options.expand_encapsulated = true;
    auto expanded = dump_der(ByteView(data), options);
    REQUIRE(expanded.ok);
    REQUIRE(expanded.nodes.size() == 2);

    const DumpNode& octets = expanded.nodes[0];
    CHECK(octets.encapsulated);
    CHECK(octets.text.empty());
    REQUIRE(octets.children.size() == 1);
    CHECK(octets.children[0].offset == 2);
    REQUIRE(octets.children[0].children.size() == 1);
    CHECK(octets.children[0].children[0].text == "7");

    const DumpNode& bits = expanded.nodes[1];
    CHECK(bits.encapsulated);
    REQUIRE(bits.children.size() == 1);
    CHECK(bits.children[0].offset == 10);
}

TEST_CASE("dump_der leaves payloads that are not DER unexpanded") {
    std::vector<uint8_t> data = {0x04, 0x02, 'a', 'b'};
    DumpOptions options;
    options.expand_encapsulated = true;

    auto result = dump_der(ByteView(data), options);
    REQUIRE(result.ok);
    CHECK_FALSE(result.nodes[0].encapsulated);
    CHECK(result.nodes[0].text == "6162");
}

TEST_CASE("dump_to_json describes every node") {
    auto data = simple_sequence();
    auto j = dump_to_json(dump_der(ByteView(data)));

    CHECK(j["ok"] == true);
    REQUIRE(j["nodes"].size() == 1);

    const auto& seq = j["nodes"][0];
    CHECK(seq["offset"] == 0);
    CHECK(seq["class"] == "universal");
    CHECK(seq["constructed"] == true);
    CHECK(seq["tag"] == 16);
    CHECK(seq["kind"] == "sequence");
    CHECK_FALSE(seq.contains("text"));
    REQUIRE(seq["children"].size() == 3);
    CHECK(seq["children"][0]["text"] == "258");
    CHECK_FALSE(seq["children"][1].contains("text"));
    CHECK_FALSE(j.contains("error"));
}

TEST_CASE("dump_to_json reports errors") {
    std::vector<uint8_t> data = {0x30, 0x80};
    auto j = dump_to_json(dump_der(ByteView(data)));

    CHECK(j["ok"] == false);
    CHECK(j["error_code"] == "indefinite_length");
    CHECK(j["error_offset"] == 1);
    CHECK(j["nodes"].empty());
}

TEST_CASE("dump_to_text prints one indented line per record") {
    auto data = simple_sequence();
    std::string text = dump_to_text(dump_der(ByteView(data)));

    CHECK(text ==
          "     0: 30 len=10 sequence\n"
          "     2:   02 len=2 integer 258\n"
          "     6:   05 len=0 null\n"
          "     8:   04 len=2 octet_string 6162\n");
}

TEST_CASE("dump_to_text labels tagged records and errors") {
    std::vector<uint8_t> data = {0xA1, 0x03, 0x02, 0x01, 0x01, 0x02};
    std::string text = dump_to_text(dump_der(ByteView(data)));

    CHECK(text ==
          "     0: a1 len=3 [context 1]\n"
          "     2:   02 len=1 integer 1\n"
          "error: truncated at offset 6\n");
}
