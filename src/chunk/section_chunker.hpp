#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"

namespace taktkb {

struct ChunkerOptions {
    // Accumulated length that forces a flush.
    std::size_t max_chars = 1400;
    // Accumulated length a heading needs to close the running section.
    std::size_t min_chars = 350;
    // Chunks shorter than this (after trimming) are dropped.
    std::size_t min_chunk_length = 120;
    std::string default_title = "Section";
};

// Running state of one document. length counts code points of every line plus one
// separator per line.
struct SectionAccumulator {
    std::string title;
    std::vector<std::string> lines;
    std::size_t length = 0;
};

// Builds the chunk the accumulated lines would produce, without touching the state.
// Returns nullopt for an empty accumulation or text shorter than min_chunk_length.
std::optional<Chunk> make_chunk(const SectionAccumulator& section,
                                const std::string& source,
                                const ChunkerOptions& options);

// make_chunk followed by clearing lines and length. The title is kept so the next
// chunk under the same heading inherits it.
std::optional<Chunk> flush_section(SectionAccumulator& section,
                                   const std::string& source,
                                   const ChunkerOptions& options);

// Advances the state machine by one paragraph. At most one chunk is produced per step.
//
// A heading closes the section only when at least min_chars have accumulated; a
// shorter section keeps accumulating and is emitted under the new heading. Body
// paragraphs are appended and force a flush once length reaches max_chars.
std::optional<Chunk> feed_paragraph(SectionAccumulator& section,
                                    const std::string& paragraph,
                                    const std::string& source,
                                    const ChunkerOptions& options);

// Chunks one document's paragraphs, starting from an empty accumulator and flushing
// once more at the end.
std::vector<Chunk> chunk_paragraphs(const std::vector<std::string>& paragraphs,
                                    const std::string& source,
                                    const ChunkerOptions& options = {});

}  // namespace taktkb
