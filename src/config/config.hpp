#pragma once

#include <cstddef>
#include <string>

#include "chunk/section_chunker.hpp"
#include "index/frequency_indexer.hpp"
#include "util/log.hpp"

namespace taktkb {

class Config {
public:
    // Reads TAKT_KB_* environment variables, falling back to the built-in defaults.
    // Throws std::runtime_error on a numeric value that is not a positive integer or an
    // unknown log level.
    static Config load();

    std::size_t max_chars() const noexcept { return max_chars_; }
    std::size_t min_chars() const noexcept { return min_chars_; }
    std::size_t min_chunk_length() const noexcept { return min_chunk_length_; }
    std::size_t max_terms() const noexcept { return max_terms_; }
    std::size_t min_token_length() const noexcept { return min_token_length_; }
    const std::string& default_title() const noexcept { return default_title_; }
    log::Level log_level() const noexcept { return log_level_; }

    ChunkerOptions chunker_options() const;
    IndexerOptions indexer_options() const;

    // One-line summary for the startup log.
    std::string describe() const;

private:
    Config(std::size_t max_chars,
           std::size_t min_chars,
           std::size_t min_chunk_length,
           std::size_t max_terms,
           std::size_t min_token_length,
           std::string default_title,
           log::Level log_level);

    std::size_t max_chars_;
    std::size_t min_chars_;
    std::size_t min_chunk_length_;
    std::size_t max_terms_;
    std::size_t min_token_length_;
    std::string default_title_;
    log::Level log_level_;
};

}  // namespace taktkb
