// ============================================================================
// text.cpp - implementation for text.hpp
// Small string helpers shared by the reply parsers. See tests/test_text.cpp.
// ============================================================================

#include "nanovna/text.hpp"

#include <cctype>
#include <sstream>

namespace nanovna {

static const char* WHITESPACE = " \t\r\n\v\f";

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(WHITESPACE);
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(WHITESPACE);
    return s.substr(b, e - b + 1);
}

std::string to_lower_ascii(std::string s) {
    // Cast to unsigned char first so std::tolower is well-defined for high bytes.
    for (auto& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

bool contains_nocase(const std::string& haystack, const std::string& lower_needle) {
    return to_lower_ascii(haystack).find(lower_needle) != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line, '\n')) lines.push_back(line);
    return lines;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream is(line);
    std::string tok;
    while (is >> tok) fields.push_back(tok);
    return fields;
}

} // namespace nanovna
