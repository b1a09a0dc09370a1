#include <sp/entry.h>
#include <sp/errors.h>
#include <cctype>

namespace sp {

namespace {
    size_t find_separator(const std::string& s) {
        bool escaped = false;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (escaped) {
                escaped = false;
                continue;
            }
            if (c == '\\') {
                escaped = true;
                continue;
            }
            if (c == '=') return i;
        }
        return std::string::npos;
    }

    std::string unescape_key(const std::string& raw, size_t line) {
        std::string key;
        key.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            char c = raw[i];
            if (c == '\\' && i + 1 < raw.size()) {
                key.push_back(raw[++i]);
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                throw SyntaxFault(SyntaxErrorKind::WhitespaceInKey, line,
                                  "whitespace inside key '" + raw + "'");
            }
            key.push_back(c);
        }
        return key;
    }

    // Whether s[pos] is escaped by an odd run of backslashes starting at or after `from`.
    bool is_escaped(const std::string& s, size_t from, size_t pos) {
        size_t slashes = 0;
        while (pos > from && s[pos - 1] == '\\') {
            ++slashes;
            --pos;
        }
        return slashes % 2 == 1;
    }

    // trim() that keeps a trailing escaped whitespace character, so `odd\ = v`
    // still yields the key "odd ".
    std::string trim_key(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
            ++start;
        }
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) &&
               !is_escaped(s, start, end - 1)) {
            --end;
        }
        return s.substr(start, end - start);
    }
}  // anonymous namespace

Entry parse_entry(const std::string& text, size_t line) {
    size_t sep = find_separator(text);
    if (sep == std::string::npos) {
        throw SyntaxFault(SyntaxErrorKind::MissingSeparator, line, "expected 'key = value', found no '='");
    }

    std::string raw_key = trim_key(text.substr(0, sep));
    if (raw_key.empty()) {
        throw SyntaxFault(SyntaxErrorKind::EmptyKey, line, "empty key before '='");
    }

    Entry e;
    e.key = unescape_key(raw_key, line);
    e.value = trim(text.substr(sep + 1));
    e.line = line;
    return e;
}

}  // namespace sp
