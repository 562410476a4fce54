#pragma once

#include <regex>
#include <string>
#include <vector>

namespace monosync {

/**
 * @brief Glob matching for bookmark names
 *
 * Bookmark names are slash separated ("small/release/1.0"), so globs
 * follow path rules:
 *   *  -> any run of characters except '/'
 *   ** -> any run of characters including '/'
 *   ?  -> a single character except '/'
 *
 * Examples:
 *   small/*      -> every bookmark directly under the small namespace
 *   release/**   -> release/1.0, release/old/2.0
 */
namespace PatternMatcher {

/**
 * @brief Convert glob pattern to std::regex
 *
 * Special regex characters are escaped; the result is anchored at both ends.
 * Example: "small/*" -> "^small/[^/]*$"
 */
std::regex globToRegex(const std::string& pattern);

/// True if the string contains glob pattern characters (*, ?)
bool isPattern(const std::string& text);

/**
 * @brief Filter names against a glob
 *
 * An empty pattern matches nothing. A pattern without glob characters is
 * treated as a literal prefix so "small/" lists the whole namespace.
 */
std::vector<std::string> matchNames(const std::string& pattern, const std::vector<std::string>& names);

}  // namespace PatternMatcher

}  // namespace monosync
