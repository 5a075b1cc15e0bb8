#include "derkit/value.hpp"

namespace derkit {

namespace {

Value::Storage make_storage(const Header& header, ByteView payload) {
    const Tag& tag = header.tag;
    if (tag.tag_class != TagClass::Universal) {
        return Custom{tag, payload};
    }
    switch (tag.number) {
        case UniversalTag::Integer: return Integer{payload};
        case UniversalTag::BitString: return BitString{payload};
        case UniversalTag::OctetString: return OctetString{payload};
        case UniversalTag::Null: return Null{};
        case UniversalTag::ObjectIdentifier: return ObjectIdentifier{payload};
        case UniversalTag::Sequence: return Sequence{payload};
        case UniversalTag::Set: return Set{payload};
        default: return Custom{tag, payload};
    }
}

} // namespace

// ============================================================================
// ObjectIdentifier
// ============================================================================

DecodeResult<std::vector<uint64_t>> ObjectIdentifier::arcs(size_t offset) const {
    using Arcs = std::vector<uint64_t>;
    if (bytes.empty()) return failure<Arcs>(ErrorCode::InvalidObjectIdentifier, offset);

    Arcs out;
    uint64_t arc = 0;
    bool in_arc = false;
    for (size_t i = 0; i < bytes.size(); ++i) {
        const uint8_t b = bytes[i];
        // Seven more bits must still fit in 64
        if ((arc >> 57) != 0) return failure<Arcs>(ErrorCode::InvalidObjectIdentifier, offset + i);
        arc = (arc << 7) | (b & 0x7F);
        in_arc = (b & 0x80) != 0;
        if (in_arc) continue;

        if (out.empty()) {
            // First subidentifier packs the first two arcs as X * 40 + Y
            if (arc < 40) {
                out.push_back(0);
                out.push_back(arc);
            } else if (arc < 80) {
                out.push_back(1);
                out.push_back(arc - 40);
            } else {
                out.push_back(2);
                out.push_back(arc - 80);
            }
        } else {
            out.push_back(arc);
        }
        arc = 0;
    }
    if (in_arc) return failure<Arcs>(ErrorCode::InvalidObjectIdentifier, offset + bytes.size());
    return success(std::move(out));
}

DecodeResult<std::string> ObjectIdentifier::to_string(size_t offset) const {
    auto decoded = arcs(offset);
    if (!decoded) return forward_failure<std::string>(decoded);

    std::string out;
    for (size_t i = 0; i < decoded.value.size(); ++i) {
        if (i > 0) out += '.';
        out += std::to_string(decoded.value[i]);
    }
    return success(std::move(out));
}

ValueIterator Sequence::iterator(size_t base_offset) const {
    return ValueIterator(bytes, base_offset);
}

ValueIterator Set::iterator(size_t base_offset) const {
    return ValueIterator(bytes, base_offset);
}

// ============================================================================
// Value
// ============================================================================

const char* value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Integer: return "integer";
        case ValueKind::BitString: return "bit_string";
        case ValueKind::OctetString: return "octet_string";
        case ValueKind::Null: return "null";
        case ValueKind::ObjectIdentifier: return "object_identifier";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Set: return "set";
        case ValueKind::Custom: return "custom";
        default: return "unknown";
    }
}

Value::Value(Header header, ByteView payload, size_t payload_offset)
    : storage_(make_storage(header, payload)),
      header_(header),
      payload_(payload),
      payload_offset_(payload_offset) {}

ValueKind Value::kind() const {
    // Follows the alternative order of Value::Storage
    switch (storage_.index()) {
        case 0: return ValueKind::Null;
        case 1: return ValueKind::Integer;
        case 2: return ValueKind::BitString;
        case 3: return ValueKind::OctetString;
        case 4: return ValueKind::ObjectIdentifier;
        case 5: return ValueKind::Sequence;
        case 6: return ValueKind::Set;
        default: return ValueKind::Custom;
    }
}

bool operator==(const Value& a, const Value& b) {
    return a.kind() == b.kind() && a.tag() == b.tag() &&
           a.payload_offset() == b.payload_offset() && a.bytes() == b.bytes();
}

DecodeResult<Value> read_value(Cursor& cursor, const Header& header) {
    const size_t payload_offset = cursor.offset();
    auto payload = cursor.read_n(header.length);
    if (!payload) return forward_failure<Value>(payload);
    return success(Value(header, payload.value, payload_offset));
}

DecodeResult<Value> parse_one(Cursor& cursor) {
    const size_t mark = cursor.position();

    auto header = read_header(cursor);
    if (!header) return forward_failure<Value>(header);

    auto value = read_value(cursor, header.value);
    if (!value) cursor.restore(mark);
    return value;
}

// ============================================================================
// ValueIterator
// ============================================================================

DecodeResult<std::optional<Value>> ValueIterator::next() {
    if (!cursor_.peek()) return success(std::optional<Value>());

    auto value = parse_one(cursor_);
    if (!value) return forward_failure<std::optional<Value>>(value);
    return success(std::optional<Value>(std::move(value.value)));
}

} // namespace derkit
