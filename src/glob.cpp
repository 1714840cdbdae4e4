#include "internal.h"

#include <cstddef>
#include <string>

namespace ferry {
namespace glob {

namespace {

/// Match one bracket expression starting at pattern[pi] == '['.
/// On return `pi` points just past the closing ']'. A '[' with no closing
/// bracket is treated as a literal character.
bool match_class(const std::string& pattern, size_t& pi, char ch) {
    size_t i = pi + 1;
    bool negate = i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^');
    if (negate) ++i;

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (ch >= lo && ch <= hi) matched = true;
            i += 3;
        } else {
            if (ch == lo) matched = true;
            ++i;
        }
    }

    if (i >= pattern.size()) {
        // Unterminated: literal '['
        ++pi;
        return ch == '[';
    }
    pi = i + 1;
    return matched != negate;
}

} // anonymous namespace

bool fnmatch(const std::string& pattern, const std::string& name) {
    size_t pi = 0, ni = 0;
    // Resume point for the most recent '*': pattern index after the star and
    // the name index it is currently absorbing up to.
    size_t star_pi = std::string::npos, star_ni = 0;

    while (ni < name.size()) {
        if (pi < pattern.size()) {
            char pc = pattern[pi];
            if (pc == '*') {
                while (pi < pattern.size() && pattern[pi] == '*') ++pi;
                if (pi == pattern.size()) return true;
                star_pi = pi;
                star_ni = ni;
                continue;
            }
            if (pc == '?') {
                ++pi; ++ni;
                continue;
            }
            if (pc == '[') {
                size_t next = pi;
                if (match_class(pattern, next, name[ni])) {
                    pi = next; ++ni;
                    continue;
                }
            } else if (pc == name[ni]) {
                ++pi; ++ni;
                continue;
            }
        }
        // Mismatch: let the last star swallow one more character.
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        ni = ++star_ni;
    }

    while (pi < pattern.size() && pattern[pi] == '*') ++pi;
    return pi == pattern.size();
}

} // namespace glob
} // namespace ferry
