#include "derkit/dump.hpp"

#include <iomanip>
#include <sstream>

namespace derkit {

namespace {

// Longest primitive payload rendered in full
constexpr size_t MAX_HEX_PREVIEW = 32;

std::string to_hex(ByteView bytes) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    const size_t shown = bytes.size() < MAX_HEX_PREVIEW ? bytes.size() : MAX_HEX_PREVIEW;
    for (size_t i = 0; i < shown; ++i) {
        out << std::setw(2) << static_cast<int>(bytes[i]);
    }
    if (shown < bytes.size()) out << "...";
    return out.str();
}

std::string render_primitive(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Integer: {
            auto integer = value.as_integer();
            auto fixed = integer.value.to_fixed<int64_t>();
            if (fixed) return std::to_string(fixed.value);
            return to_hex(value.bytes());
        }
        case ValueKind::ObjectIdentifier: {
            auto dotted = value.as_object_identifier().value.to_string(value.payload_offset());
            if (dotted) return dotted.value;
            return to_hex(value.bytes());
        }
        case ValueKind::BitString: {
            auto bits = value.as_bit_string().value;
            return "unused=" + std::to_string(bits.unused_bits()) + " " + to_hex(bits.string());
        }
        case ValueKind::Null:
            return "";
        default:
            return to_hex(value.bytes());
    }
}

bool is_container(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Sequence:
        case ValueKind::Set:
            return true;
        case ValueKind::Custom:
            return value.tag().constructed;
        default:
            return false;
    }
}

class Walker {
public:
    Walker(const DumpOptions& options, DumpResult& result) : options_(options), result_(result) {}

    bool walk(ByteView payload, size_t base_offset, size_t depth, std::vector<DumpNode>& out) {
        if (depth > options_.max_depth && !payload.empty()) {
            return fail(ErrorCode::DepthExceeded, base_offset);
        }

        ValueIterator it(payload, base_offset);
        while (true) {
            auto next = it.next();
            if (!next) return fail(next.error, next.offset);
            if (!next.value) return true;

            const Value& value = *next.value;
            DumpNode node;
            node.header_size = value.header().encoded_size;
            node.offset = value.payload_offset() - node.header_size;
            node.length = value.header().length;
            node.tag = value.tag();
            node.kind = value.kind();

            if (is_container(value)) {
                if (!walk(value.bytes(), value.payload_offset(), depth + 1, node.children)) {
                    out.push_back(std::move(node));
                    return false;
                }
            } else {
                node.text = render_primitive(value);
                if (options_.expand_encapsulated) expand(value, depth, node);
            }
            out.push_back(std::move(node));
        }
    }

private:
    bool fail(ErrorCode code, size_t offset) {
        result_.error_code = code;
        result_.error_offset = offset;
        result_.error = std::string(error_code_to_string(code)) + " at offset " + std::to_string(offset);
        return false;
    }

    // Encapsulated DER is shown only when the whole payload parses
    void expand(const Value& value, size_t depth, DumpNode& node) {
        ByteView inner = value.bytes();
        size_t inner_offset = value.payload_offset();
        if (value.kind() == ValueKind::BitString) {
            if (inner.empty() || inner[0] != 0) return;
            inner = inner.subview(1);
            inner_offset += 1;
        } else if (value.kind() != ValueKind::OctetString) {
            return;
        }
        if (inner.empty()) return;

        DumpResult trial;
        Walker nested(options_, trial);
        std::vector<DumpNode> children;
        if (!nested.walk(inner, inner_offset, depth + 1, children)) return;

        node.children = std::move(children);
        node.encapsulated = true;
        node.text.clear();
    }

    const DumpOptions& options_;
    DumpResult& result_;
};

nlohmann::json node_to_json(const DumpNode& node) {
    nlohmann::json j;
    j["offset"] = node.offset;
    j["header_size"] = node.header_size;
    j["length"] = node.length;
    j["class"] = tag_class_to_string(node.tag.tag_class);
    j["constructed"] = node.tag.constructed;
    j["tag"] = node.tag.number;
    j["kind"] = value_kind_to_string(node.kind);
    if (!node.text.empty()) j["text"] = node.text;
    if (node.encapsulated) j["encapsulated"] = true;
    if (!node.children.empty()) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto& child : node.children) {
            children.push_back(node_to_json(child));
        }
        j["children"] = std::move(children);
    }
    return j;
}

void node_to_text(const DumpNode& node, size_t indent, std::ostringstream& out) {
    out << std::setw(6) << std::setfill(' ') << std::dec << node.offset << ": "
        << std::string(indent * 2, ' ')
        << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(node.tag.identifier_octet())
        << std::dec << " len=" << node.length << " ";

    if (node.kind == ValueKind::Custom) {
        out << "[" << tag_class_to_string(node.tag.tag_class) << " " << static_cast<int>(node.tag.number)
            << "]";
    } else {
        out << value_kind_to_string(node.kind);
    }
    if (node.encapsulated) out << " (encapsulates)";
    if (!node.text.empty()) out << " " << node.text;
    out << "\n";

    for (const auto& child : node.children) {
        node_to_text(child, indent + 1, out);
    }
}

} // namespace

DumpResult dump_der(ByteView buffer, const DumpOptions& options) {
    DumpResult result;
    Walker walker(options, result);
    result.ok = walker.walk(buffer, 0, 0, result.nodes);
    return result;
}

nlohmann::json dump_to_json(const DumpResult& result) {
    nlohmann::json j;
    j["ok"] = result.ok;

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : result.nodes) {
        nodes.push_back(node_to_json(node));
    }
    j["nodes"] = std::move(nodes);

    if (!result.ok) {
        j["error"] = result.error;
        if (result.error_code) j["error_code"] = error_code_to_string(*result.error_code);
        j["error_offset"] = result.error_offset;
    }
    return j;
}

std::string dump_to_text(const DumpResult& result) {
    std::ostringstream out;
    for (const auto& node : result.nodes) {
        node_to_text(node, 0, out);
    }
    if (!result.ok) {
        out << "error: " << result.error << "\n";
    }
    return out.str();
}

} // namespace derkit
