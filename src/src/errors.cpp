#include <sp/errors.h>
#include <sstream>

namespace sp {

std::string to_string(SyntaxErrorKind kind) {
    switch (kind) {
        case SyntaxErrorKind::MissingSeparator:
            return "MissingSeparator";
        case SyntaxErrorKind::EmptyKey:
            return "EmptyKey";
        case SyntaxErrorKind::WhitespaceInKey:
            return "WhitespaceInKey";
    }
    return "unknown";
}

std::string to_string(SchemaErrorKind kind) {
    switch (kind) {
        case SchemaErrorKind::UnknownType:
            return "UnknownType";
        case SchemaErrorKind::MalformedPattern:
            return "MalformedPattern";
        case SchemaErrorKind::MalformedType:
            return "MalformedType";
    }
    return "unknown";
}

namespace {
    std::string located(const std::string& prefix, const std::string& detail, size_t line) {
        std::ostringstream ss;
        ss << prefix << detail << " (line " << line << ")";
        return ss.str();
    }
}  // anonymous namespace

SyntaxFault::SyntaxFault(SyntaxErrorKind k, size_t l, const std::string& detail)
    : std::runtime_error(located("sysctl parse error: ", detail, l)), kind(k), line(l) {}

DuplicateKeyFault::DuplicateKeyFault(const std::string& k, size_t first, size_t second)
    : std::runtime_error(located("sysctl parse error: duplicate key '" + k + "', first defined on line " +
                                         std::to_string(first),
                                 "", second)),
      key(k),
      first_line(first),
      second_line(second) {}

SchemaSyntaxFault::SchemaSyntaxFault(SchemaErrorKind k, size_t l, const std::string& detail)
    : std::runtime_error(located("schema parse error: ", detail, l)), kind(k), line(l) {}

}  // namespace sp
