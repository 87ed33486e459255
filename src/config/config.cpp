#include "config/config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace taktkb {
namespace {

std::string env_or_default(const char* name, const char* default_value) {
    if (const char* value = std::getenv(name); value && *value) {
        return value;
    }
    return default_value;
}

std::size_t env_size_or_default(const char* name, std::size_t default_value) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return default_value;
    }

    const std::string text{value};
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string{name} + " must be an integer, got \"" + text + '"');
    }
    if (consumed != text.size()) {
        throw std::runtime_error(std::string{name} + " must be an integer, got \"" + text + '"');
    }
    if (parsed <= 0) {
        throw std::runtime_error(std::string{name} + " must be positive");
    }
    return static_cast<std::size_t>(parsed);
}

}  // namespace

Config::Config(std::size_t max_chars,
               std::size_t min_chars,
               std::size_t min_chunk_length,
               std::size_t max_terms,
               std::size_t min_token_length,
               std::string default_title,
               log::Level log_level)
    : max_chars_(max_chars),
      min_chars_(min_chars),
      min_chunk_length_(min_chunk_length),
      max_terms_(max_terms),
      min_token_length_(min_token_length),
      default_title_(std::move(default_title)),
      log_level_(log_level) {}

Config Config::load() {
    const ChunkerOptions chunker_defaults;
    const IndexerOptions indexer_defaults;

    return Config{
        env_size_or_default("TAKT_KB_MAX_CHARS", chunker_defaults.max_chars),
        env_size_or_default("TAKT_KB_MIN_CHARS", chunker_defaults.min_chars),
        env_size_or_default("TAKT_KB_MIN_CHUNK_LENGTH", chunker_defaults.min_chunk_length),
        env_size_or_default("TAKT_KB_MAX_TERMS", indexer_defaults.max_terms),
        env_size_or_default("TAKT_KB_MIN_TOKEN_LENGTH", indexer_defaults.min_token_length),
        env_or_default("TAKT_KB_DEFAULT_TITLE", chunker_defaults.default_title.c_str()),
        log::parse_level(env_or_default("TAKT_KB_LOG_LEVEL", "info"))};
}

ChunkerOptions Config::chunker_options() const {
    ChunkerOptions options;
    options.max_chars = max_chars_;
    options.min_chars = min_chars_;
    options.min_chunk_length = min_chunk_length_;
    options.default_title = default_title_;
    return options;
}

IndexerOptions Config::indexer_options() const {
    IndexerOptions options;
    options.max_terms = max_terms_;
    options.min_token_length = min_token_length_;
    return options;
}

std::string Config::describe() const {
    std::ostringstream oss;
    oss << "max_chars=" << max_chars_ << " min_chars=" << min_chars_
        << " min_chunk_length=" << min_chunk_length_ << " max_terms=" << max_terms_
        << " min_token_length=" << min_token_length_ << " default_title=\"" << default_title_
        << "\" log_level=" << log::level_name(log_level_);
    return oss.str();
}

}  // namespace taktkb
