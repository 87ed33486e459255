#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

namespace taktkb::fixtures {

struct ZipEntryFixture {
    std::string name;
    std::string content;
    bool deflate = false;
};

inline void put_u16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

inline void put_u32(std::string& out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

inline std::string deflate_raw(const std::string& input) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string output(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());
    const int rc = deflate(&stream, Z_FINISH);
    const uLong produced = stream.total_out;
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    output.resize(produced);
    return output;
}

// Builds a minimal ZIP archive in memory.
inline std::string build_zip(const std::vector<ZipEntryFixture>& entries) {
    std::string archive;
    std::string directory;
    for (const auto& entry : entries) {
        const std::string payload = entry.deflate ? deflate_raw(entry.content) : entry.content;
        const auto crc = static_cast<std::uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(entry.content.data()),
                  static_cast<uInt>(entry.content.size())));
        const auto method = static_cast<std::uint16_t>(entry.deflate ? 8 : 0);
        const auto offset = static_cast<std::uint32_t>(archive.size());

        put_u32(archive, 0x04034b50);
        put_u16(archive, 20);
        put_u16(archive, 0);
        put_u16(archive, method);
        put_u16(archive, 0);
        put_u16(archive, 0);
        put_u32(archive, crc);
        put_u32(archive, static_cast<std::uint32_t>(payload.size()));
        put_u32(archive, static_cast<std::uint32_t>(entry.content.size()));
        put_u16(archive, static_cast<std::uint16_t>(entry.name.size()));
        put_u16(archive, 0);
        archive += entry.name;
        archive += payload;

        put_u32(directory, 0x02014b50);
        put_u16(directory, 20);
        put_u16(directory, 20);
        put_u16(directory, 0);
        put_u16(directory, method);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, crc);
        put_u32(directory, static_cast<std::uint32_t>(payload.size()));
        put_u32(directory, static_cast<std::uint32_t>(entry.content.size()));
        put_u16(directory, static_cast<std::uint16_t>(entry.name.size()));
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, 0);
        put_u32(directory, offset);
        directory += entry.name;
    }

    const auto directory_offset = static_cast<std::uint32_t>(archive.size());
    archive += directory;
    put_u32(archive, 0x06054b50);
    put_u16(archive, 0);
    put_u16(archive, 0);
    put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    put_u16(archive, static_cast<std::uint16_t>(entries.size()));
    put_u32(archive, static_cast<std::uint32_t>(directory.size()));
    put_u32(archive, directory_offset);
    put_u16(archive, 0);
    return archive;
}

// Wraps paragraph XML fragments in a WordprocessingML main part.
inline std::string word_document(const std::string& body_xml) {
    return R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
           R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" )"
           R"(xmlns:wps="http://schemas.microsoft.com/office/word/2010/wordprocessingShape" )"
           R"(xmlns:mc="http://schemas.openxmlformats.org/markup-compatibility/2006">)"
           "<w:body>" +
           body_xml + "<w:sectPr/></w:body></w:document>";
}

}  // namespace taktkb::fixtures
