#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace taktkb {

// Renders paragraphs as plain text: one paragraph per line, headings (per
// is_plain_heading) set apart as "\n=== heading ===\n". The result is trimmed and ends
// with a single newline.
std::string render_plain_text(const std::vector<std::string>& paragraphs);

// "<stem with spaces replaced by underscores>.txt"
std::string plain_text_file_name(const std::filesystem::path& source);

// Regular files with the ".docx" extension directly inside dir, sorted by name.
// A missing directory yields an empty list.
std::vector<std::filesystem::path> find_docx_files(const std::filesystem::path& dir);

}  // namespace taktkb
