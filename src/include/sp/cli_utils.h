#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace sp {
namespace cli_utils {

// Levenshtein distance, computed with two rolling rows.
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known option to `arg`, or "" when nothing is within three edits
// (or 40% of the argument's length, if that is larger).
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    std::string best;
    size_t best_distance = 0;
    for (auto const& opt : options) {
        size_t d = edit_distance(arg, opt);
        if (best.empty() || d < best_distance) {
            best = opt;
            best_distance = d;
        }
    }
    size_t threshold = std::max<size_t>(3, arg.size() * 2 / 5);
    if (best.empty() || best_distance > threshold) return "";
    return best;
}

inline std::string unknown_argument_message(const std::string& arg, const std::vector<std::string>& options) {
    std::string msg = "Unknown argument: " + arg;
    std::string suggestion = closest_option(arg, options);
    if (!suggestion.empty()) msg += "\n  Did you mean '" + suggestion + "'?";
    return msg;
}

}  // namespace cli_utils
}  // namespace sp
