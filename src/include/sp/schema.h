#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace sp {

// The type a rule demands of a value. Values stay strings until the
// validator checks them against one of these.
struct ValueType {
    enum TYPE { String, Integer, Boolean, Enum, Regex };

    TYPE type = String;
    std::vector<std::string> members;  // Enum
    std::string pattern;               // Regex source text
    std::shared_ptr<const std::regex> compiled;

    static ValueType string() { return ValueType{}; }
    static ValueType integer();
    static ValueType boolean();
    static ValueType enumeration(std::vector<std::string> values);
    // Throws std::regex_error when `source` does not compile.
    static ValueType regex(const std::string& source);

    // Schema spelling of the type, e.g. "int" or "enum(a,b)".
    std::string describe() const;
};

// Dotted key pattern. A segment equal to "*" matches exactly one key segment.
class KeyPattern {
public:
    KeyPattern() = default;
    explicit KeyPattern(std::vector<std::string> segments);

    const std::vector<std::string>& segments() const { return segments_; }
    bool has_wildcard() const { return wildcard_; }
    bool matches(const std::string& key) const;
    std::string str() const;

private:
    std::vector<std::string> segments_;
    bool wildcard_ = false;
};

// Throws SchemaSyntaxFault(MalformedPattern) on an empty segment, a '*'
// that shares its segment with other characters, or a second '*' segment.
KeyPattern parse_key_pattern(const std::string& text, size_t line = 0);

std::vector<std::string> split_key(const std::string& key);

struct SchemaRule {
    KeyPattern pattern;
    ValueType type;
    size_t line = 0;  // schema source line

    std::string describe() const { return pattern.str() + " " + type.describe(); }
};

// Rules in declaration order; the first rule matching a key governs it.
class Schema {
public:
    using const_iterator = std::vector<SchemaRule>::const_iterator;

    Schema() = default;
    explicit Schema(std::vector<SchemaRule> rules) : rules_(std::move(rules)) {}

    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }
    const SchemaRule& operator[](size_t i) const { return rules_[i]; }
    const_iterator begin() const { return rules_.begin(); }
    const_iterator end() const { return rules_.end(); }

    // First rule whose pattern matches `key`, or nullptr.
    const SchemaRule* match(const std::string& key) const;

private:
    std::vector<SchemaRule> rules_;
};

// Parse schema text: one `pattern TYPE` (or `pattern -> TYPE`) rule per
// line, with the same '#'/';' comment lines as configuration files.
// TYPE is string, int, bool, enum(v1,...) or regex(<pattern>).
Schema parse_schema(const std::string& text);

}  // namespace sp
