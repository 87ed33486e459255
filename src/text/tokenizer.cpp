#include "text/tokenizer.hpp"

#include <utility>

#include "util/utf8.hpp"

namespace taktkb {
namespace {

constexpr char32_t kMultiplicationSign = 0xD7;
constexpr char32_t kDivisionSign = 0xF7;

bool is_latin1_letter(char32_t c) {
    return c >= 0xC0 && c <= 0xFF && c != kMultiplicationSign && c != kDivisionSign;
}

}  // namespace

bool is_word_char(char32_t c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
        return true;
    }
    return is_latin1_letter(c);
}

char32_t to_lower(char32_t c) {
    if (c >= 'A' && c <= 'Z') {
        return c + ('a' - 'A');
    }
    // U+00C0..U+00DE map to U+00E0..U+00FE; U+00DF (sharp s) has no single-code-point lower form.
    if (c >= 0xC0 && c <= 0xDE && c != kMultiplicationSign) {
        return c + 0x20;
    }
    return c;
}

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (const char32_t c : utf8::decode(text)) {
        if (is_word_char(c)) {
            utf8::append(current, to_lower(c));
            continue;
        }
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

}  // namespace taktkb
