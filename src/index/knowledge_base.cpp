#include "index/knowledge_base.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace taktkb {
namespace {

nlohmann::ordered_json terms_to_json(const std::vector<TermCount>& terms) {
    auto object = nlohmann::ordered_json::object();
    for (const auto& entry : terms) {
        object[entry.term] = entry.count;
    }
    return object;
}

}  // namespace

KnowledgeBase assemble_knowledge_base(std::vector<IndexedChunk> chunks, DocumentFrequency df) {
    KnowledgeBase kb;
    kb.chunk_count = chunks.size();
    kb.df = std::move(df);
    kb.chunks = std::move(chunks);
    return kb;
}

void to_json(nlohmann::ordered_json& json, const KnowledgeBase& kb) {
    auto chunks = nlohmann::ordered_json::array();
    for (const auto& indexed : kb.chunks) {
        chunks.push_back(nlohmann::ordered_json{
            {"source", indexed.chunk.source},
            {"title", indexed.chunk.title},
            {"text", indexed.chunk.text},
            {"tf", terms_to_json(indexed.tf)},
        });
    }

    json = nlohmann::ordered_json::object();
    json["chunk_count"] = kb.chunk_count;
    json["df"] = terms_to_json(kb.df.entries());
    json["chunks"] = std::move(chunks);
}

std::string dump_knowledge_base(const KnowledgeBase& kb) {
    const nlohmann::ordered_json json = kb;
    // Invalid UTF-8 from a plain-text source becomes U+FFFD, as the tokenizer already saw it.
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

void write_knowledge_base(const KnowledgeBase& kb, const std::string& path) {
    // Serialize first so a failure never leaves a truncated file behind.
    const std::string body = dump_knowledge_base(kb);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("failed to open output file: " + path);
    }
    out << body;
    out.flush();
    if (!out) {
        throw std::runtime_error("failed to write output file: " + path);
    }
}

}  // namespace taktkb
