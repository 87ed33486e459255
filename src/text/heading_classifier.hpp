#pragma once

#include <cstddef>
#include <string_view>

namespace taktkb {

constexpr std::size_t kMaxSectionHeadingLength = 120;
constexpr std::size_t kMaxPlainHeadingLength = 80;

// Heading test used by the chunker. A line qualifies when it is at most
// kMaxSectionHeadingLength code points and begins with one of:
//   "TEIL"/"PART" + whitespace + uppercase letter        named part
//   digits + "." + whitespace + "Schritt"/"Step"         numbered step
//   digits + "." + whitespace                            numbered list item
//   7+ characters of [A-Z ÄÖÜ... 0-9 space - _ /], first not a separator
//   "<" + non-">" characters + ">"                       bracket tag
bool is_section_heading(std::string_view line);

// Looser heading test used when rendering documents to plain text: at most
// kMaxPlainHeadingLength code points and fully uppercase, or starting with two digits,
// or starting with "Step", "Schritt", "0.", "1.", "2." or "3.".
// Letter case is known only for ASCII and Latin-1 (U+00C0..U+00FF); every other code
// point counts as uncased. A Greek or Cyrillic all-caps line is therefore not fully
// uppercase, and "ABCł" is.
bool is_plain_heading(std::string_view line);

}  // namespace taktkb
