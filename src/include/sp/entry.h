#pragma once

#include <cstddef>
#include <string>
#include <sp/line_scanner.h>

namespace sp {

struct Entry {
    std::string key;
    std::string value;
    size_t line = 0;

    bool operator==(const Entry& other) const {
        return key == other.key && value == other.value && line == other.line;
    }
    bool operator!=(const Entry& other) const { return !(*this == other); }
};

// Split one logical line at its first unescaped '='. The key is trimmed and
// has its backslash escapes resolved; the value is trimmed but otherwise kept
// verbatim (an empty value is legal). Throws SyntaxFault on a line without a
// separator, with an empty key, or with whitespace inside the key.
Entry parse_entry(const std::string& text, size_t line);

inline Entry parse_entry(const LogicalLine& l) { return parse_entry(l.text, l.line); }

}  // namespace sp
