#include <sp/line_scanner.h>
#include <cctype>
#include <utility>

namespace sp {

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(start, end - start);
}

std::optional<LogicalLine> LineScanner::next() {
    while (pos_ < text_.size()) {
        size_t eol = text_.find('\n', pos_);
        if (eol == std::string::npos) eol = text_.size();

        // trim() also drops the '\r' of CRLF endings
        std::string content = trim(text_.substr(pos_, eol - pos_));
        pos_ = eol + 1;
        ++line_;

        if (content.empty() || is_comment_marker(content.front())) continue;
        return LogicalLine{std::move(content), line_};
    }
    return std::nullopt;
}

std::vector<LogicalLine> scan_lines(const std::string& text) {
    std::vector<LogicalLine> out;
    LineScanner scanner(text);
    while (auto l = scanner.next()) out.push_back(std::move(*l));
    return out;
}

}  // namespace sp
