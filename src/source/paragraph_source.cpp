#include "source/paragraph_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "docx/docx_reader.hpp"
#include "util/utf8.hpp"

namespace taktkb {
namespace {

bool has_text_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".txt";
}

constexpr std::string_view kSeparatorOpen = "=== ";
constexpr std::string_view kSeparatorClose = " ===";

// docx_to_text writes headings as "=== heading ===".
std::string unwrap_heading_separator(std::string line) {
    const std::size_t marker_size = kSeparatorOpen.size() + kSeparatorClose.size();
    if (line.size() <= marker_size) {
        return line;
    }
    const std::string_view view{line};
    if (view.substr(0, kSeparatorOpen.size()) != kSeparatorOpen ||
        view.substr(view.size() - kSeparatorClose.size()) != kSeparatorClose) {
        return line;
    }
    std::string heading = utf8::trim(view.substr(kSeparatorOpen.size(),
                                                 view.size() - marker_size));
    return heading.empty() ? line : heading;
}

std::vector<std::string> read_text_paragraphs(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open document: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return split_text_paragraphs(ss.str());
}

}  // namespace

std::vector<std::string> split_text_paragraphs(std::string_view text) {
    std::vector<std::string> paragraphs;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t newline = text.find('\n', start);
        const std::size_t end = (newline == std::string_view::npos) ? text.size() : newline;
        std::string line = utf8::trim(text.substr(start, end - start));
        if (!line.empty()) {
            paragraphs.push_back(unwrap_heading_separator(std::move(line)));
        }
        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }
    return paragraphs;
}

std::vector<std::string> read_paragraphs(const std::string& path) {
    if (has_text_extension(path)) {
        return read_text_paragraphs(path);
    }
    return read_docx_paragraphs(path);
}

}  // namespace taktkb
