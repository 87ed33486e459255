#include "chunk/section_chunker.hpp"
#include "config/config.hpp"
#include "index/frequency_indexer.hpp"
#include "index/knowledge_base.hpp"
#include "source/paragraph_source.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace taktkb {
namespace {

constexpr const char* kUsage =
    "Usage: build_knowledge <doc1> <name1> <doc2> <name2> [<doc3> <name3> ...] <out.json>";

struct SourceDocument {
    std::string path;
    std::string name;
};

int run_build(const Config& config,
              const std::vector<SourceDocument>& documents,
              const std::string& out_path) {
    const time::Stopwatch stopwatch;
    const ChunkerOptions chunker_options = config.chunker_options();

    std::vector<Chunk> chunks;
    for (const auto& document : documents) {
        const auto paragraphs = read_paragraphs(document.path);
        auto document_chunks = chunk_paragraphs(paragraphs, document.name, chunker_options);

        std::ostringstream oss;
        oss << "chunked " << document.path << " as " << document.name
            << ": paragraphs=" << paragraphs.size() << " chunks=" << document_chunks.size();
        log::info(oss.str());
        if (document_chunks.empty()) {
            log::warn(document.name + ": no section reached the minimum chunk length");
        }

        chunks.insert(chunks.end(), std::make_move_iterator(document_chunks.begin()),
                      std::make_move_iterator(document_chunks.end()));
    }

    const FrequencyIndexer indexer(config.indexer_options());
    DocumentFrequency df;
    auto indexed = indexer.index(chunks, df);
    const auto kb = assemble_knowledge_base(std::move(indexed), std::move(df));

    write_knowledge_base(kb, out_path);

    std::ostringstream done;
    done << "knowledge base written: chunks=" << kb.chunk_count << " terms=" << kb.df.size()
         << " elapsed_ms=" << stopwatch.elapsed_ms();
    log::info(done.str());

    std::cout << "OK: wrote " << out_path << " with " << kb.chunk_count << " chunks" << std::endl;
    return 0;
}

}  // namespace
}  // namespace taktkb

int main(int argc, char** argv) {
    // At least two (document, name) pairs followed by the output path.
    if (argc < 5 || (argc - 2) % 2 != 0) {
        std::cerr << taktkb::kUsage << std::endl;
        return 1;
    }

    try {
        taktkb::log::info(std::string{"build_knowledge starting (version "} + taktkb::kVersion +
                          ')');
        const auto config = taktkb::Config::load();
        taktkb::log::set_threshold(config.log_level());
        taktkb::log::info("config: " + config.describe());

        std::vector<taktkb::SourceDocument> documents;
        for (int i = 1; i + 1 < argc - 1; i += 2) {
            documents.push_back({argv[i], argv[i + 1]});
        }
        return taktkb::run_build(config, documents, argv[argc - 1]);
    } catch (const std::exception& ex) {
        taktkb::log::error(std::string{"fatal error: "} + ex.what());
        return 1;
    }
}
