#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace taktkb {

// Read-only view of a ZIP container held in memory. Supports stored and deflated
// entries; ZIP64 and encrypted entries are rejected.
class ZipArchive {
public:
    // Takes ownership of the raw archive bytes and indexes the central directory.
    // Throws std::runtime_error when the bytes are not a readable ZIP archive.
    explicit ZipArchive(std::string data);

    static ZipArchive open_file(const std::string& path);

    bool contains(const std::string& name) const;
    std::vector<std::string> entry_names() const;

    // Returns the uncompressed bytes of an entry after checking its CRC-32.
    std::string read(const std::string& name) const;

private:
    struct Entry {
        std::string name;
        std::uint16_t flags = 0;
        std::uint16_t method = 0;
        std::uint32_t crc32 = 0;
        std::uint32_t compressed_size = 0;
        std::uint32_t uncompressed_size = 0;
        std::uint32_t local_header_offset = 0;
    };

    void index_central_directory();
    const Entry& find_entry(const std::string& name) const;

    std::string data_;
    std::vector<Entry> entries_;
};

}  // namespace taktkb
