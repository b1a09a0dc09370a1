#pragma once

#include <sp/document.h>
#include <string>
#include <utility>
#include <vector>

namespace sp {

enum class JsonLayout {
    Flat,    // {"a.b": "1", ...} in file order
    Nested,  // dotted keys become nested objects
    Entries  // [{"key": "a.b", "value": "1", "line": 1}, ...]
};

// Render a Document as JSON. Values are always emitted as JSON strings.
std::string dump_json(const Document& doc, JsonLayout layout = JsonLayout::Flat, int indent = 4);

std::string escape_json_string(const std::string& s);

// Read JSON written by dump_json (any layout) back into (key, value) pairs.
// Nested objects are flattened by joining their keys with '.'. Throws
// std::runtime_error ("JSON parse error: ... (line N, column M)") on
// malformed input or on values that are not strings.
std::vector<std::pair<std::string, std::string>> parse_json_pairs(const std::string& text);

}  // namespace sp
