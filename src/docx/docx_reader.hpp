#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace taktkb {

// Paragraph text of a WordprocessingML main part (word/document.xml): one entry per
// top-level w:p of the body, trimmed, empty paragraphs dropped.
std::vector<std::string> extract_docx_paragraphs(std::string_view document_xml);

// Opens a .docx file and returns its body paragraphs in document order.
// Throws std::runtime_error when the file is missing, is not a ZIP container, or has no
// parsable word/document.xml.
std::vector<std::string> read_docx_paragraphs(const std::string& path);

}  // namespace taktkb
