#pragma once
/**
 * @file text.hpp
 * @brief Small ASCII text helpers shared by the reply parsers and the detector.
 *
 * Firmware replies are plain 7-bit text with "\r\n" line ends. These helpers
 * do exactly what the heuristics need and nothing locale-aware.
 */

#include <string>
#include <vector>

namespace nanovna {

/// Copy with leading/trailing whitespace (space, \t, \r, \n, \v, \f) removed.
std::string trim(const std::string& s);

/// ASCII lowercase copy.
std::string to_lower_ascii(std::string s);

/// Case-insensitive substring test. @p lower_needle must already be lowercase.
bool contains_nocase(const std::string& haystack, const std::string& lower_needle);

/// True when @p s begins with @p prefix (case-sensitive).
bool starts_with(const std::string& s, const std::string& prefix);

/// Split on '\n'. "\r" stays attached; callers trim.
std::vector<std::string> split_lines(const std::string& text);

/// Split on runs of whitespace, dropping empties.
std::vector<std::string> split_fields(const std::string& line);

} // namespace nanovna
