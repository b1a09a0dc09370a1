#include <sp/validate.h>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

namespace sp {

// Helper: limit quoted values in messages to 60 characters (truncate with ...)
static std::string quote_value(const std::string& value, size_t maxlen = 60) {
    if (value.size() <= maxlen) return "'" + value + "'";
    return "'" + value.substr(0, maxlen - 3) + "...'";
}

static bool debug_enabled() { return std::getenv("SP_VALIDATE_DEBUG") != nullptr; }

std::string to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::UNMATCHED_KEY:
            return "unmatched key";
        case ErrorCategory::TYPE_MISMATCH:
            return "type mismatch";
        case ErrorCategory::MISSING_REQUIRED:
            return "missing key";
    }
    return "unknown";
}

size_t Violation::line() const {
    if (entry) return entry->line;
    if (rule) return rule->line;
    return 0;
}

std::string Violation::key() const {
    if (entry) return entry->key;
    if (rule) return rule->pattern.str();
    return std::string();
}

size_t ValidationResult::count(ErrorCategory category) const {
    size_t n = 0;
    for (auto const& v : violations) {
        if (v.category == category) ++n;
    }
    return n;
}

static std::optional<std::string> check_integer(const std::string& value) {
    if (value.empty()) return std::string("empty value is not an integer");
    size_t i = 0;
    if (value[0] == '+' || value[0] == '-') ++i;
    if (i == value.size()) return "value " + quote_value(value) + " has a sign but no digits";
    for (size_t k = i; k < value.size(); ++k) {
        if (!std::isdigit(static_cast<unsigned char>(value[k])))
            return "value " + quote_value(value) + " is not a base-10 integer";
    }
    // from_chars rejects a leading '+'
    const char* first = value.data() + (value[0] == '+' ? 1 : 0);
    const char* last = value.data() + value.size();
    int64_t parsed = 0;
    auto res = std::from_chars(first, last, parsed);
    if (res.ec == std::errc::result_out_of_range)
        return "value " + quote_value(value) + " does not fit in a 64-bit integer";
    if (res.ec != std::errc() || res.ptr != last)
        return "value " + quote_value(value) + " is not a base-10 integer";
    return std::nullopt;
}

std::optional<std::string> check_value(const std::string& value, const ValueType& type, BooleanStyle style) {
    switch (type.type) {
        case ValueType::String:
            return std::nullopt;
        case ValueType::Integer:
            return check_integer(value);
        case ValueType::Boolean: {
            const char* yes = style == BooleanStyle::ZeroOne ? "1" : "true";
            const char* no = style == BooleanStyle::ZeroOne ? "0" : "false";
            if (value == yes || value == no) return std::nullopt;
            return "value " + quote_value(value) + " is not one of '" + yes + "', '" + no + "'";
        }
        case ValueType::Enum:
            for (auto const& m : type.members) {
                if (m == value) return std::nullopt;
            }
            return "value " + quote_value(value) + " not one of " + type.describe();
        case ValueType::Regex:
            if (value.size() > kMaxRegexValueLength) {
                return "value of " + std::to_string(value.size()) + " characters is too long to match /" +
                       type.pattern + "/ (limit " + std::to_string(kMaxRegexValueLength) + ")";
            }
            if (type.compiled && std::regex_match(value, *type.compiled)) return std::nullopt;
            return "value " + quote_value(value) + " does not match /" + type.pattern + "/";
    }
    return std::string("unsupported type");
}

static std::string expected_text(const ValueType& type, BooleanStyle style) {
    if (type.type == ValueType::Boolean)
        return style == BooleanStyle::ZeroOne ? "bool (0|1)" : "bool (true|false)";
    return type.describe();
}

ValidationResult validate(const Document& doc, const Schema& schema, const ValidateOptions& options) {
    ValidationResult result;
    const bool debug = debug_enabled();

    for (auto const& entry : doc) {
        const SchemaRule* rule = schema.match(entry.key);
        if (debug) {
            std::cerr << "validate: line " << entry.line << " key '" << entry.key << "' -> "
                      << (rule ? "rule '" + rule->describe() + "' (schema line " + std::to_string(rule->line) + ")"
                               : std::string("no rule"))
                      << "\n";
        }

        if (!rule) {
            if (!options.strict) continue;
            Violation v;
            v.entry = entry;
            v.category = ErrorCategory::UNMATCHED_KEY;
            v.expected = "a key declared in the schema";
            v.actual = entry.key;
            v.message = "line " + std::to_string(entry.line) + ": key '" + entry.key +
                        "' is not declared in the schema";
            result.violations.push_back(std::move(v));
            continue;
        }

        auto problem = check_value(entry.value, rule->type, options.boolean_style);
        if (!problem) continue;

        Violation v;
        v.entry = entry;
        v.rule = *rule;
        v.category = ErrorCategory::TYPE_MISMATCH;
        v.expected = expected_text(rule->type, options.boolean_style);
        v.actual = entry.value;
        std::ostringstream ss;
        ss << "line " << entry.line << ": key '" << entry.key << "': expected " << v.expected << ", "
           << *problem << " (rule '" << rule->pattern.str() << "' on schema line " << rule->line << ")";
        v.message = ss.str();
        result.violations.push_back(std::move(v));
    }

    if (options.require_exact) {
        std::set<std::string> reported;
        for (auto const& rule : schema) {
            if (rule.pattern.has_wildcard()) continue;
            const std::string key = rule.pattern.str();
            if (doc.has(key)) continue;
            if (!reported.insert(key).second) continue;

            Violation v;
            v.rule = rule;
            v.category = ErrorCategory::MISSING_REQUIRED;
            v.expected = key;
            v.message = "schema line " + std::to_string(rule.line) + ": missing required key '" + key + "'";
            result.violations.push_back(std::move(v));
        }
    }

    if (debug) {
        std::cerr << "validate: " << result.violation_count() << " violation(s)\n";
    }
    return result;
}

}  // namespace sp
