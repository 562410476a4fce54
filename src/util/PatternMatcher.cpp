#include "util/PatternMatcher.hpp"

#include <regex>

namespace monosync {
namespace PatternMatcher {

std::regex globToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                regexStr += ".*";
                ++i;
            } else {
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.') {
            regexStr += "\\.";
        } else if (c == '+' || c == '[' || c == ']' || c == '(' || c == ')' ||
                   c == '{' || c == '}' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    regexStr += "$";
    return std::regex(regexStr);
}

bool isPattern(const std::string& text) {
    return text.find('*') != std::string::npos ||
           text.find('?') != std::string::npos;
}

std::vector<std::string> matchNames(const std::string& pattern, const std::vector<std::string>& names) {
    std::vector<std::string> matches;
    if (pattern.empty()) {
        return matches;
    }

    if (!isPattern(pattern)) {
        for (const auto& name : names) {
            if (name.rfind(pattern, 0) == 0) matches.push_back(name);
        }
        return matches;
    }

    std::regex re = globToRegex(pattern);
    for (const auto& name : names) {
        if (std::regex_match(name, re)) {
            matches.push_back(name);
        }
    }
    return matches;
}

}  // namespace PatternMatcher
}  // namespace monosync
