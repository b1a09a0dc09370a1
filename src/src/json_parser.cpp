#include <sp/json.h>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace sp {

namespace {
    struct JsonParseError : public std::runtime_error {
        size_t line, col;
        JsonParseError(const std::string& msg, size_t l, size_t c)
            : std::runtime_error(msg), line(l), col(c) {}
    };

    struct Value {
        enum Kind { Object, Array, String, Scalar };
        Kind kind = Scalar;
        std::string text;
        std::vector<std::pair<std::string, Value>> members;
        std::vector<Value> items;
        size_t line = 0, col = 0;
    };

    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << "JSON parse error: " << base << " (line " << err_line << ", column " << err_col << ")" << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& msg) {
            throw JsonParseError(format_error(msg, line, col), line, col);
        }

        void skip_ws() {
            while (i < s.size() and std::isspace(static_cast<unsigned char>(s[i]))) get();
        }

        void expect(char ch) {
            skip_ws();
            if (peek() != ch) fail(std::string("expected '") + ch + "'");
            get();
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == '"') return parse_string();
            if (c == '{') return parse_object();
            if (c == '[') return parse_array();
            if (c == '\0') fail("unexpected end of input");
            return parse_scalar();
        }

        // numbers, true/false/null: kept as raw text, rejected later if used as a value
        Value parse_scalar() {
            Value v;
            v.line = line;
            v.col = col;
            size_t start = i;
            while (i < s.size() and (std::isalnum(static_cast<unsigned char>(s[i])) or s[i] == '-' or s[i] == '+' or
                                     s[i] == '.'))
                get();
            if (start == i) fail("unexpected token while parsing value");
            v.text = s.substr(start, i - start);
            return v;
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') fail("unterminated unicode escape");
                int hv = hex_val(h);
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        Value parse_string() {
            Value v;
            v.kind = Value::String;
            v.line = line;
            v.col = col;
            get();  // opening quote
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') fail("unexpected end in string");
                if (c == '"') break;
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // surrogate pair
                        if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and
                            s[i + 1] == 'u') {
                            get();
                            get();
                            uint32_t lo = parse_hex4();
                            if (lo < 0xDC00 or lo > 0xDFFF) fail("invalid surrogate pair");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    case '\0':
                        fail("unexpected end in string escape");
                    default:
                        fail("unsupported escape sequence");
                }
            }
            v.text = std::move(out);
            return v;
        }

        Value parse_array() {
            Value v;
            v.kind = Value::Array;
            v.line = line;
            v.col = col;
            opener_stack.push_back(Opener{'[', line, col});
            get();
            skip_ws();
            if (peek() == ']') {
                get();
                opener_stack.pop_back();
                return v;
            }
            while (true) {
                v.items.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ',') { get(); continue; }
                if (c == ']') { get(); break; }
                fail("expected ',' or ']' in array");
            }
            opener_stack.pop_back();
            return v;
        }

        Value parse_object() {
            Value v;
            v.kind = Value::Object;
            v.line = line;
            v.col = col;
            opener_stack.push_back(Opener{'{', line, col});
            get();
            skip_ws();
            if (peek() == '}') {
                get();
                opener_stack.pop_back();
                return v;
            }
            while (true) {
                skip_ws();
                if (peek() != '"') fail("expected string key in object");
                std::string key = parse_string().text;
                expect(':');
                v.members.emplace_back(std::move(key), parse_value());
                skip_ws();
                char c = peek();
                if (c == ',') { get(); continue; }
                if (c == '}') { get(); break; }
                fail("expected ',' or '}' in object");
            }
            opener_stack.pop_back();
            return v;
        }

        Value parse_document() {
            Value v = parse_value();
            skip_ws();
            if (i < s.size()) fail("extra data after JSON value");
            return v;
        }

        [[noreturn]] void fail_at(const Value& v, const std::string& msg) const {
            throw JsonParseError(format_error(msg, v.line, v.col), v.line, v.col);
        }

        const std::string& require_string(const Value& v, const std::string& what) const {
            if (v.kind != Value::String) fail_at(v, what + " must be a string");
            return v.text;
        }

        void flatten(const Value& obj, const std::string& prefix,
                     std::vector<std::pair<std::string, std::string>>& out) const {
            for (auto const& m : obj.members) {
                std::string key = prefix.empty() ? m.first : prefix + "." + m.first;
                if (m.second.kind == Value::Object) {
                    flatten(m.second, key, out);
                    continue;
                }
                out.emplace_back(key, require_string(m.second, "value of '" + key + "'"));
            }
        }

        const Value* member(const Value& obj, const std::string& name) const {
            for (auto const& m : obj.members) {
                if (m.first == name) return &m.second;
            }
            return nullptr;
        }

        std::vector<std::pair<std::string, std::string>> pairs(const Value& root) const {
            std::vector<std::pair<std::string, std::string>> out;
            if (root.kind == Value::Object) {
                flatten(root, "", out);
                return out;
            }
            if (root.kind != Value::Array) fail_at(root, "expected an object or an array of entries");
            for (auto const& item : root.items) {
                if (item.kind != Value::Object) fail_at(item, "entry must be an object");
                const Value* k = member(item, "key");
                const Value* val = member(item, "value");
                if (!k || !val) fail_at(item, "entry needs \"key\" and \"value\"");
                out.emplace_back(require_string(*k, "\"key\""), require_string(*val, "\"value\""));
            }
            return out;
        }
    };
}  // anonymous namespace

std::vector<std::pair<std::string, std::string>> parse_json_pairs(const std::string& text) {
    Parser p(text);
    Value root = p.parse_document();
    return p.pairs(root);
}

}  // namespace sp
