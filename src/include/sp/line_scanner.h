#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sp {

struct LogicalLine {
    std::string text;  // trimmed
    size_t line = 0;   // 1-based
};

// Walks newline-delimited text and yields the lines that carry content.
// Blank lines and lines whose first non-blank character is '#' or ';' are
// skipped. Inline trailing comments are left alone, so values may contain '#'.
// The scanner keeps a reference to `text`; it must outlive the scanner.
class LineScanner {
public:
    explicit LineScanner(const std::string& text) : text_(text) {}
    LineScanner(std::string&&) = delete;

    // Next logical line, or std::nullopt once the text is exhausted.
    std::optional<LogicalLine> next();

private:
    const std::string& text_;
    size_t pos_ = 0;
    size_t line_ = 0;
};

std::vector<LogicalLine> scan_lines(const std::string& text);

std::string trim(const std::string& str);

inline bool is_comment_marker(char c) { return c == '#' || c == ';'; }

}  // namespace sp
