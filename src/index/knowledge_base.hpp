#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "index/frequency_indexer.hpp"

namespace taktkb {

struct KnowledgeBase {
    std::size_t chunk_count = 0;
    DocumentFrequency df;
    std::vector<IndexedChunk> chunks;
};

KnowledgeBase assemble_knowledge_base(std::vector<IndexedChunk> chunks, DocumentFrequency df);

// {"chunk_count", "df", "chunks": [{"source", "title", "text", "tf"}]} with keys in that
// order, df in first-seen order and each tf in its trimmed order.
void to_json(nlohmann::ordered_json& json, const KnowledgeBase& kb);

// Serializes kb as UTF-8 JSON with non-ASCII characters written literally. Byte sequences
// that are not valid UTF-8 are written as U+FFFD.
std::string dump_knowledge_base(const KnowledgeBase& kb);

// Writes the serialized knowledge base to path, replacing any existing file.
void write_knowledge_base(const KnowledgeBase& kb, const std::string& path);

}  // namespace taktkb
