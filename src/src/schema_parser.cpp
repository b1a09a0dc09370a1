#include <sp/schema.h>
#include <sp/errors.h>
#include <sp/line_scanner.h>
#include <cctype>
#include <sstream>

namespace sp {

ValueType ValueType::integer() {
    ValueType t;
    t.type = Integer;
    return t;
}

ValueType ValueType::boolean() {
    ValueType t;
    t.type = Boolean;
    return t;
}

ValueType ValueType::enumeration(std::vector<std::string> values) {
    ValueType t;
    t.type = Enum;
    t.members = std::move(values);
    return t;
}

ValueType ValueType::regex(const std::string& source) {
    ValueType t;
    t.type = Regex;
    t.pattern = source;
    t.compiled = std::make_shared<const std::regex>(source, std::regex::ECMAScript);
    return t;
}

std::string ValueType::describe() const {
    switch (type) {
        case String:
            return "string";
        case Integer:
            return "int";
        case Boolean:
            return "bool";
        case Enum: {
            std::ostringstream ss;
            ss << "enum(";
            for (size_t i = 0; i < members.size(); ++i) {
                if (i) ss << ",";
                ss << members[i];
            }
            ss << ")";
            return ss.str();
        }
        case Regex:
            return "regex(" + pattern + ")";
    }
    return "unknown";
}

std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(key.substr(start));
            break;
        }
        parts.push_back(key.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

KeyPattern::KeyPattern(std::vector<std::string> segments) : segments_(std::move(segments)) {
    for (auto const& s : segments_) {
        if (s == "*") wildcard_ = true;
    }
}

bool KeyPattern::matches(const std::string& key) const {
    if (!wildcard_) return key == str();

    auto parts = split_key(key);
    if (parts.size() != segments_.size()) return false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (segments_[i] == "*") {
            if (parts[i].empty()) return false;
            continue;
        }
        if (segments_[i] != parts[i]) return false;
    }
    return true;
}

std::string KeyPattern::str() const {
    std::string out;
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i) out.push_back('.');
        out += segments_[i];
    }
    return out;
}

KeyPattern parse_key_pattern(const std::string& text, size_t line) {
    if (text.empty()) {
        throw SchemaSyntaxFault(SchemaErrorKind::MalformedPattern, line, "empty key pattern");
    }
    auto segments = split_key(text);
    size_t wildcards = 0;
    for (auto const& seg : segments) {
        if (seg.empty()) {
            throw SchemaSyntaxFault(SchemaErrorKind::MalformedPattern, line,
                                    "empty segment in pattern '" + text + "'");
        }
        if (seg != "*" && seg.find('*') != std::string::npos) {
            throw SchemaSyntaxFault(SchemaErrorKind::MalformedPattern, line,
                                    "wildcard must occupy a whole segment in pattern '" + text + "'");
        }
        if (seg == "*" && ++wildcards > 1) {
            throw SchemaSyntaxFault(SchemaErrorKind::MalformedPattern, line,
                                    "more than one wildcard in pattern '" + text + "'");
        }
    }
    return KeyPattern(std::move(segments));
}

const SchemaRule* Schema::match(const std::string& key) const {
    for (auto const& rule : rules_) {
        if (rule.pattern.matches(key)) return &rule;
    }
    return nullptr;
}

namespace {
    struct RuleParser {
        const LogicalLine& l;
        size_t i = 0;

        explicit RuleParser(const LogicalLine& logical) : l(logical) {}

        const std::string& s() const { return l.text; }

        bool at_arrow() const { return s().compare(i, 2, "->") == 0; }

        void skip_ws() {
            while (i < s().size() && std::isspace(static_cast<unsigned char>(s()[i]))) ++i;
        }

        std::string parse_pattern_token() {
            size_t start = i;
            while (i < s().size() && !std::isspace(static_cast<unsigned char>(s()[i])) && !at_arrow()) ++i;
            return s().substr(start, i - start);
        }

        // "enum(" / "regex(" arguments, without the parentheses
        std::string parenthesised(const std::string& spec, const std::string& name) {
            if (spec.size() < name.size() + 2 || spec.back() != ')') {
                throw SchemaSyntaxFault(SchemaErrorKind::MalformedType, l.line,
                                        "expected ')' to close " + name + "(...)");
            }
            return spec.substr(name.size() + 1, spec.size() - name.size() - 2);
        }

        ValueType parse_type(const std::string& spec, const std::string& pattern) {
            if (spec.empty()) {
                throw SchemaSyntaxFault(SchemaErrorKind::UnknownType, l.line,
                                        "missing type for pattern '" + pattern + "'");
            }
            if (spec == "string") return ValueType::string();
            if (spec == "int" || spec == "integer") return ValueType::integer();
            if (spec == "bool" || spec == "boolean") return ValueType::boolean();

            if (spec.compare(0, 5, "enum(") == 0) {
                std::string inner = parenthesised(spec, "enum");
                std::vector<std::string> members;
                size_t start = 0;
                while (true) {
                    size_t comma = inner.find(',', start);
                    std::string m = trim(inner.substr(start, comma == std::string::npos ? std::string::npos
                                                                                       : comma - start));
                    if (m.empty()) {
                        throw SchemaSyntaxFault(SchemaErrorKind::MalformedType, l.line,
                                                "empty member in '" + spec + "'");
                    }
                    members.push_back(m);
                    if (comma == std::string::npos) break;
                    start = comma + 1;
                }
                return ValueType::enumeration(std::move(members));
            }

            if (spec.compare(0, 6, "regex(") == 0) {
                std::string inner = parenthesised(spec, "regex");
                try {
                    return ValueType::regex(inner);
                } catch (const std::regex_error& e) {
                    throw SchemaSyntaxFault(SchemaErrorKind::MalformedType, l.line,
                                            "invalid regex '" + inner + "': " + e.what());
                }
            }

            throw SchemaSyntaxFault(SchemaErrorKind::UnknownType, l.line, "unknown type '" + spec + "'");
        }

        SchemaRule parse() {
            std::string pattern = parse_pattern_token();
            skip_ws();
            if (at_arrow()) {
                i += 2;
                skip_ws();
            }
            std::string spec = trim(s().substr(i));

            SchemaRule rule;
            rule.pattern = parse_key_pattern(pattern, l.line);
            rule.type = parse_type(spec, pattern);
            rule.line = l.line;
            return rule;
        }
    };
}  // anonymous namespace

Schema parse_schema(const std::string& text) {
    std::vector<SchemaRule> rules;
    LineScanner scanner(text);
    while (auto l = scanner.next()) {
        RuleParser parser(*l);
        rules.push_back(parser.parse());
    }
    return Schema(std::move(rules));
}

}  // namespace sp
