#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taktkb::utf8 {

constexpr char32_t kReplacementChar = 0xFFFD;

// Decodes UTF-8 into code points. Malformed bytes decode to U+FFFD one byte at a time,
// so every input has a well-defined length.
std::vector<char32_t> decode(std::string_view text);

void append(std::string& out, char32_t code_point);
std::string encode(const std::vector<char32_t>& code_points);

// Number of code points in text.
std::size_t length(std::string_view text);

bool is_space(char32_t c);

// Strips leading and trailing whitespace, Unicode spaces included.
std::string trim(std::string_view text);

}  // namespace taktkb::utf8
