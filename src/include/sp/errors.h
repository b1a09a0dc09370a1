#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sp {

enum class SyntaxErrorKind { MissingSeparator, EmptyKey, WhitespaceInKey };

enum class SchemaErrorKind { UnknownType, MalformedPattern, MalformedType };

std::string to_string(SyntaxErrorKind kind);
std::string to_string(SchemaErrorKind kind);

// Raised by the entry parser for a line that is not a valid `key = value` entry.
struct SyntaxFault : public std::runtime_error {
    SyntaxErrorKind kind;
    size_t line;
    SyntaxFault(SyntaxErrorKind k, size_t l, const std::string& detail);
};

// Raised by the document builder when a key is defined twice under the
// Reject policy.
struct DuplicateKeyFault : public std::runtime_error {
    std::string key;
    size_t first_line;
    size_t second_line;
    DuplicateKeyFault(const std::string& k, size_t first, size_t second);
};

struct SchemaSyntaxFault : public std::runtime_error {
    SchemaErrorKind kind;
    size_t line;
    SchemaSyntaxFault(SchemaErrorKind k, size_t l, const std::string& detail);
};

}  // namespace sp
