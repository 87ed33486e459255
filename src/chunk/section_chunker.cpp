#include "chunk/section_chunker.hpp"

#include <utility>

#include "text/heading_classifier.hpp"
#include "util/utf8.hpp"

namespace taktkb {
namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace

std::optional<Chunk> make_chunk(const SectionAccumulator& section,
                                const std::string& source,
                                const ChunkerOptions& options) {
    if (section.lines.empty()) {
        return std::nullopt;
    }
    std::string text = utf8::trim(join_lines(section.lines));
    if (utf8::length(text) < options.min_chunk_length) {
        return std::nullopt;
    }

    Chunk chunk;
    chunk.source = source;
    chunk.title = section.title.empty() ? options.default_title : section.title;
    chunk.text = std::move(text);
    return chunk;
}

std::optional<Chunk> flush_section(SectionAccumulator& section,
                                   const std::string& source,
                                   const ChunkerOptions& options) {
    auto chunk = make_chunk(section, source, options);
    section.lines.clear();
    section.length = 0;
    return chunk;
}

std::optional<Chunk> feed_paragraph(SectionAccumulator& section,
                                    const std::string& paragraph,
                                    const std::string& source,
                                    const ChunkerOptions& options) {
    if (is_section_heading(paragraph)) {
        std::optional<Chunk> closed;
        if (section.length >= options.min_chars) {
            closed = flush_section(section, source, options);
        }
        section.title = paragraph;
        return closed;
    }

    section.lines.push_back(paragraph);
    section.length += utf8::length(paragraph) + 1;
    if (section.length >= options.max_chars) {
        return flush_section(section, source, options);
    }
    return std::nullopt;
}

std::vector<Chunk> chunk_paragraphs(const std::vector<std::string>& paragraphs,
                                    const std::string& source,
                                    const ChunkerOptions& options) {
    std::vector<Chunk> chunks;
    SectionAccumulator section;
    for (const auto& paragraph : paragraphs) {
        if (auto chunk = feed_paragraph(section, paragraph, source, options)) {
            chunks.push_back(std::move(*chunk));
        }
    }
    if (auto chunk = flush_section(section, source, options)) {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

}  // namespace taktkb
