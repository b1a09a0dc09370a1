#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <sp/document.h>
#include <sp/schema.h>

namespace sp {

// Which spellings a `bool` rule accepts. Exactly one set is in force.
enum class BooleanStyle {
    TrueFalse,  // "true" / "false"
    ZeroOne     // "0" / "1"
};

struct ValidateOptions {
    bool strict = false;         // keys no rule matches are violations
    bool require_exact = false;  // keys of wildcard-free rules must be present
    BooleanStyle boolean_style = BooleanStyle::TrueFalse;
};

enum class ErrorCategory {
    UNMATCHED_KEY,
    TYPE_MISMATCH,
    MISSING_REQUIRED
};

std::string to_string(ErrorCategory category);

struct Violation {
    std::optional<Entry> entry;      // empty for MISSING_REQUIRED
    std::optional<SchemaRule> rule;  // empty for UNMATCHED_KEY
    ErrorCategory category = ErrorCategory::TYPE_MISMATCH;
    std::string expected;
    std::string actual;
    std::string message;

    // Configuration line for entry violations, schema line for missing keys.
    size_t line() const;
    std::string key() const;
};

struct ValidationResult {
    std::vector<Violation> violations;

    bool is_valid() const { return violations.empty(); }
    size_t violation_count() const { return violations.size(); }
    size_t count(ErrorCategory category) const;
};

// Check every entry of `doc` against `schema`. Never stops at the first
// problem: entry violations come in document order, then missing keys in
// rule order.
ValidationResult validate(const Document& doc, const Schema& schema,
                          const ValidateOptions& options = ValidateOptions{});

// Longest value a regex rule is matched against. std::regex_match recurses
// per character, and sysctl values never exceed one page.
constexpr size_t kMaxRegexValueLength = 4096;

// Check one value against a type. Returns std::nullopt when it conforms,
// otherwise a short description of what is wrong with it.
std::optional<std::string> check_value(const std::string& value, const ValueType& type,
                                       BooleanStyle style = BooleanStyle::TrueFalse);

}  // namespace sp
