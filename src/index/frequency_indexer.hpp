#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chunk/chunk.hpp"

namespace taktkb {

struct TermCount {
    std::string term;
    int count = 0;
};

inline bool operator==(const TermCount& lhs, const TermCount& rhs) {
    return lhs.term == rhs.term && lhs.count == rhs.count;
}

// Term table in a defined order: first occurrence for raw counts, descending count after
// trimming.
using TermFrequency = std::vector<TermCount>;

struct IndexerOptions {
    // Shorter tokens (in code points) are not counted.
    std::size_t min_token_length = 3;
    // Entries kept per chunk after trimming.
    std::size_t max_terms = 250;
};

// Counts the tokens of text that are at least min_token_length long, in order of first
// occurrence.
TermFrequency count_terms(std::string_view text, const IndexerOptions& options);

// Orders entries by count, highest first, keeping first-occurrence order among equal
// counts, and cuts the table to max_terms entries.
TermFrequency trim_terms(TermFrequency terms, std::size_t max_terms);

// Number of chunks each term occurs in, across the whole corpus.
class DocumentFrequency {
public:
    // Adds one to every term present in an untrimmed chunk table.
    void add_chunk(const TermFrequency& terms);

    int count(const std::string& term) const;
    std::size_t size() const noexcept { return entries_.size(); }
    // Terms in the order they were first seen.
    const std::vector<TermCount>& entries() const noexcept { return entries_; }

private:
    std::vector<TermCount> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

struct IndexedChunk {
    Chunk chunk;
    TermFrequency tf;
};

class FrequencyIndexer {
public:
    explicit FrequencyIndexer(IndexerOptions options = {});

    // Computes each chunk's term table, records it in df before trimming, and returns the
    // chunks with their trimmed tables in input order.
    std::vector<IndexedChunk> index(const std::vector<Chunk>& chunks,
                                    DocumentFrequency& df) const;

    const IndexerOptions& options() const noexcept { return options_; }

private:
    IndexerOptions options_;
};

}  // namespace taktkb
