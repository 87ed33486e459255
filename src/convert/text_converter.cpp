#include "convert/text_converter.hpp"

#include <algorithm>

#include "text/heading_classifier.hpp"
#include "util/utf8.hpp"

namespace taktkb {

std::string render_plain_text(const std::vector<std::string>& paragraphs) {
    std::string out;
    for (std::size_t i = 0; i < paragraphs.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        const std::string& text = paragraphs[i];
        if (is_plain_heading(text)) {
            out += "\n=== " + text + " ===\n";
        } else {
            out += text;
        }
    }
    return utf8::trim(out) + "\n";
}

std::string plain_text_file_name(const std::filesystem::path& source) {
    std::string stem = source.stem().string();
    std::replace(stem.begin(), stem.end(), ' ', '_');
    return stem + ".txt";
}

std::vector<std::filesystem::path> find_docx_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    if (!std::filesystem::is_directory(dir)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".docx") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace taktkb
