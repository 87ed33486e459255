#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace taktkb {

// Word characters are ASCII letters and digits plus the Latin-1 letters (ÄÖÜäöüß and
// the other accented forms).
bool is_word_char(char32_t c);

// Lowercases ASCII and Latin-1 uppercase letters; everything else is returned unchanged.
char32_t to_lower(char32_t c);

// Splits text into maximal runs of word characters, lowercased, in order of appearance.
// No length filter is applied here.
std::vector<std::string> tokenize(std::string_view text);

}  // namespace taktkb
