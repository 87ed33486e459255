#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace taktkb {

// Trimmed, non-empty lines of a plain-text document. A "=== heading ===" line, as written
// by docx_to_text, yields the bare heading.
std::vector<std::string> split_text_paragraphs(std::string_view text);

// Reads the paragraphs of one source document. Files ending in ".txt" are read as
// plain text, one paragraph per line; anything else is opened as DOCX.
std::vector<std::string> read_paragraphs(const std::string& path);

}  // namespace taktkb
