#include "index/frequency_indexer.hpp"

#include <algorithm>
#include <utility>

#include "text/tokenizer.hpp"
#include "util/utf8.hpp"

namespace taktkb {

TermFrequency count_terms(std::string_view text, const IndexerOptions& options) {
    TermFrequency terms;
    std::unordered_map<std::string, std::size_t> positions;
    for (auto& token : tokenize(text)) {
        if (utf8::length(token) < options.min_token_length) {
            continue;
        }
        const auto found = positions.find(token);
        if (found != positions.end()) {
            ++terms[found->second].count;
            continue;
        }
        positions.emplace(token, terms.size());
        terms.push_back(TermCount{std::move(token), 1});
    }
    return terms;
}

TermFrequency trim_terms(TermFrequency terms, std::size_t max_terms) {
    std::stable_sort(terms.begin(), terms.end(), [](const TermCount& lhs, const TermCount& rhs) {
        return lhs.count > rhs.count;
    });
    if (terms.size() > max_terms) {
        terms.resize(max_terms);
    }
    return terms;
}

void DocumentFrequency::add_chunk(const TermFrequency& terms) {
    for (const auto& entry : terms) {
        const auto found = positions_.find(entry.term);
        if (found != positions_.end()) {
            ++entries_[found->second].count;
            continue;
        }
        positions_.emplace(entry.term, entries_.size());
        entries_.push_back(TermCount{entry.term, 1});
    }
}

int DocumentFrequency::count(const std::string& term) const {
    const auto found = positions_.find(term);
    return found == positions_.end() ? 0 : entries_[found->second].count;
}

FrequencyIndexer::FrequencyIndexer(IndexerOptions options) : options_(options) {}

std::vector<IndexedChunk> FrequencyIndexer::index(const std::vector<Chunk>& chunks,
                                                  DocumentFrequency& df) const {
    std::vector<IndexedChunk> indexed;
    indexed.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        TermFrequency terms = count_terms(chunk.text, options_);
        df.add_chunk(terms);

        IndexedChunk entry;
        entry.chunk = chunk;
        entry.tf = trim_terms(std::move(terms), options_.max_terms);
        indexed.push_back(std::move(entry));
    }
    return indexed;
}

}  // namespace taktkb
