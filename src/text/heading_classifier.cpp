#include "text/heading_classifier.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "util/utf8.hpp"

namespace taktkb {
namespace {

using CodePoints = std::vector<char32_t>;

constexpr std::size_t kMinEmphasizedRun = 7;

bool is_ascii_digit(char32_t c) { return c >= '0' && c <= '9'; }

bool is_upper_letter(char32_t c) {
    return (c >= 'A' && c <= 'Z') || (c >= 0xC0 && c <= 0xDE && c != 0xD7);
}

bool is_lower_letter(char32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 0xDF && c <= 0xFF && c != 0xF7);
}

bool starts_with(const CodePoints& line, std::size_t pos, std::string_view ascii) {
    if (line.size() - pos < ascii.size()) {
        return false;
    }
    for (std::size_t i = 0; i < ascii.size(); ++i) {
        if (line[pos + i] != static_cast<unsigned char>(ascii[i])) {
            return false;
        }
    }
    return true;
}

std::size_t skip_spaces(const CodePoints& line, std::size_t pos) {
    while (pos < line.size() && utf8::is_space(line[pos])) {
        ++pos;
    }
    return pos;
}

bool matches_named_part(const CodePoints& line) {
    if (!starts_with(line, 0, "TEIL") && !starts_with(line, 0, "PART")) {
        return false;
    }
    constexpr std::size_t kMarkerLength = 4;
    const std::size_t after_spaces = skip_spaces(line, kMarkerLength);
    if (after_spaces == kMarkerLength || after_spaces >= line.size()) {
        return false;
    }
    return line[after_spaces] >= 'A' && line[after_spaces] <= 'Z';
}

// Digits, a period and whitespace. This also accepts every "N. Step" / "N. Schritt"
// line, so the step marker needs no separate check.
bool matches_numbered_marker(const CodePoints& line) {
    std::size_t pos = 0;
    while (pos < line.size() && is_ascii_digit(line[pos])) {
        ++pos;
    }
    if (pos == 0 || pos >= line.size() || line[pos] != '.') {
        return false;
    }
    ++pos;
    return pos < line.size() && utf8::is_space(line[pos]);
}

bool matches_emphasized(const CodePoints& line) {
    if (line.empty() || !(is_upper_letter(line[0]) || is_ascii_digit(line[0]))) {
        return false;
    }
    std::size_t run = 1;
    while (run < line.size() && run < kMinEmphasizedRun) {
        const char32_t c = line[run];
        const bool allowed = is_upper_letter(c) || is_ascii_digit(c) || c == ' ' || c == '-' ||
                             c == '_' || c == '/';
        if (!allowed) {
            break;
        }
        ++run;
    }
    return run >= kMinEmphasizedRun;
}

bool matches_bracket_tag(const CodePoints& line) {
    if (line.size() < 3 || line[0] != '<') {
        return false;
    }
    const auto close = std::find(line.begin() + 1, line.end(), U'>');
    return close != line.end() && close != line.begin() + 1;
}

// At least one cased letter and no lowercase one, cased meaning ASCII or Latin-1.
bool is_fully_uppercase(const CodePoints& line) {
    bool has_upper = false;
    for (const char32_t c : line) {
        if (is_lower_letter(c)) {
            return false;
        }
        has_upper = has_upper || is_upper_letter(c);
    }
    return has_upper;
}

bool starts_with_two_digits(const CodePoints& line) {
    const std::size_t prefix = std::min<std::size_t>(2, line.size());
    if (prefix == 0) {
        return false;
    }
    return std::all_of(line.begin(), line.begin() + static_cast<std::ptrdiff_t>(prefix),
                       is_ascii_digit);
}

}  // namespace

bool is_section_heading(std::string_view line) {
    const CodePoints code_points = utf8::decode(line);
    if (code_points.size() > kMaxSectionHeadingLength) {
        return false;
    }
    return matches_named_part(code_points) || matches_numbered_marker(code_points) ||
           matches_emphasized(code_points) || matches_bracket_tag(code_points);
}

bool is_plain_heading(std::string_view line) {
    static constexpr std::array<std::string_view, 6> kPrefixes = {"Step", "Schritt", "0.",
                                                                  "1.",   "2.",      "3."};

    const CodePoints code_points = utf8::decode(line);
    if (code_points.size() > kMaxPlainHeadingLength) {
        return false;
    }
    if (is_fully_uppercase(code_points) || starts_with_two_digits(code_points)) {
        return true;
    }
    return std::any_of(kPrefixes.begin(), kPrefixes.end(), [&](std::string_view prefix) {
        return starts_with(code_points, 0, prefix);
    });
}

}  // namespace taktkb
