#include <sp/json.h>
#include <sp/schema.h>
#include <cstdio>
#include <sstream>

namespace sp {

std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

namespace {
    // Tree for the nested layout. Children keep first-appearance order.
    struct Node {
        bool leaf = false;
        std::string value;
        std::vector<std::pair<std::string, Node>> children;

        Node& child(const std::string& name) {
            for (auto& c : children) {
                if (c.first == name) return c.second;
            }
            children.emplace_back(name, Node());
            return children.back().second;
        }
    };

    // A later key wins over an earlier one when one is a prefix of the other.
    void insert_nested(Node& root, const std::vector<std::string>& parts, const std::string& value) {
        Node* cur = &root;
        for (size_t i = 0; i < parts.size(); ++i) {
            Node& next = cur->child(parts[i]);
            if (i + 1 == parts.size()) {
                next.leaf = true;
                next.value = value;
                next.children.clear();
                return;
            }
            if (next.leaf) {
                next.leaf = false;
                next.value.clear();
            }
            cur = &next;
        }
    }

    std::string pad(int n) { return std::string(static_cast<size_t>(n), ' '); }

    void dump_node(std::ostringstream& out, const Node& n, int level, int indent) {
        if (n.leaf) {
            out << escape_json_string(n.value);
            return;
        }
        if (n.children.empty()) {
            out << "{}";
            return;
        }
        out << "{\n";
        for (size_t i = 0; i < n.children.size(); ++i) {
            out << pad(level + indent) << escape_json_string(n.children[i].first) << ": ";
            dump_node(out, n.children[i].second, level + indent, indent);
            out << (i + 1 < n.children.size() ? ",\n" : "\n");
        }
        out << pad(level) << "}";
    }

    void dump_flat(std::ostringstream& out, const Document& doc, int indent) {
        if (doc.empty()) {
            out << "{}";
            return;
        }
        out << "{\n";
        for (size_t i = 0; i < doc.size(); ++i) {
            out << pad(indent) << escape_json_string(doc[i].key) << ": " << escape_json_string(doc[i].value);
            out << (i + 1 < doc.size() ? ",\n" : "\n");
        }
        out << "}";
    }

    void dump_entries(std::ostringstream& out, const Document& doc, int indent) {
        if (doc.empty()) {
            out << "[]";
            return;
        }
        out << "[\n";
        for (size_t i = 0; i < doc.size(); ++i) {
            const Entry& e = doc[i];
            out << pad(indent) << "{\"key\": " << escape_json_string(e.key)
                << ", \"value\": " << escape_json_string(e.value) << ", \"line\": " << e.line << "}";
            out << (i + 1 < doc.size() ? ",\n" : "\n");
        }
        out << "]";
    }
}  // anonymous namespace

std::string dump_json(const Document& doc, JsonLayout layout, int indent) {
    std::ostringstream out;
    switch (layout) {
        case JsonLayout::Flat:
            dump_flat(out, doc, indent);
            break;
        case JsonLayout::Nested: {
            Node root;
            for (auto const& e : doc) insert_nested(root, split_key(e.key), e.value);
            dump_node(out, root, 0, indent);
            break;
        }
        case JsonLayout::Entries:
            dump_entries(out, doc, indent);
            break;
    }
    return out.str();
}

}  // namespace sp
