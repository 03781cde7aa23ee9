#include "glob_match.h"

namespace veto {

/*
Greedy two-pointer matcher with a single backtrack point.

When a '*' is seen we remember where it was and where the text stood. On a
later mismatch we let the last '*' swallow one more text byte and retry from
just after it. Only the most recent star ever needs to be revisited: any match
an earlier star could produce is also reachable by extending the later one.
Runs in O(|pattern| * |text|) worst case with no recursion.
*/
bool glob_match(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t star_p = std::string::npos;
    size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_t = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            p++;
            t++;
        } else if (star_p != std::string::npos) {
            p = star_p + 1;
            t = ++star_t;
        } else {
            return false;
        }
    }

    // Text consumed: the rest of the pattern may only be stars.
    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}

bool validate_pattern(const std::string& pattern, std::string* err) {
    if (pattern.empty()) {
        if (err) *err = "empty pattern";
        return false;
    }
    for (char c : pattern) {
        if (c == '\0' || c == '\n' || c == '\r') {
            if (err) *err = "pattern contains a control character";
            return false;
        }
    }
    return true;
}

bool pattern_matches_everything(const std::string& pattern) {
    if (pattern.empty()) return false;
    for (char c : pattern) {
        if (c != '*') return false;
    }
    return true;
}

} // namespace veto
