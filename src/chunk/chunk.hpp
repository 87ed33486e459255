#pragma once

#include <string>

namespace taktkb {

struct Chunk {
    std::string source;
    std::string title;
    std::string text;
};

inline bool operator==(const Chunk& lhs, const Chunk& rhs) {
    return lhs.source == rhs.source && lhs.title == rhs.title && lhs.text == rhs.text;
}

inline bool operator!=(const Chunk& lhs, const Chunk& rhs) { return !(lhs == rhs); }

}  // namespace taktkb
