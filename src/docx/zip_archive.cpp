#include "docx/zip_archive.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <zlib.h>

namespace taktkb {
namespace {

constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr std::uint32_t kCentralDirEntrySignature = 0x02014b50;
constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;

constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kCentralDirEntrySize = 46;
constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

constexpr std::uint32_t kMaxEntrySize = 256u * 1024u * 1024u;

std::uint16_t read_u16(const std::string& data, std::size_t offset) {
    if (offset + 2 > data.size()) {
        throw std::runtime_error("zip: truncated archive");
    }
    const auto* p = reinterpret_cast<const unsigned char*>(data.data() + offset);
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::string& data, std::size_t offset) {
    if (offset + 4 > data.size()) {
        throw std::runtime_error("zip: truncated archive");
    }
    const auto* p = reinterpret_cast<const unsigned char*>(data.data() + offset);
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::size_t find_end_of_central_directory(const std::string& data) {
    if (data.size() < kEndOfCentralDirSize) {
        throw std::runtime_error("zip: file too small to be an archive");
    }
    const std::size_t last = data.size() - kEndOfCentralDirSize;
    const std::size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
    for (std::size_t pos = last + 1; pos-- > first;) {
        if (read_u32(data, pos) == kEndOfCentralDirSignature) {
            return pos;
        }
    }
    throw std::runtime_error("zip: end of central directory not found");
}

std::string inflate_raw(const char* input, std::size_t input_size, std::size_t output_size) {
    std::string output(output_size, '\0');

    z_stream stream{};
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error("zip: inflateInit2 failed");
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input));
    stream.avail_in = static_cast<uInt>(input_size);
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output_size);

    const int rc = inflate(&stream, Z_FINISH);
    const uLong produced = stream.total_out;
    inflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        std::ostringstream oss;
        oss << "zip: inflate failed (code " << rc << ')';
        throw std::runtime_error(oss.str());
    }
    if (produced != output_size) {
        throw std::runtime_error("zip: inflated size does not match directory");
    }
    return output;
}

}  // namespace

ZipArchive::ZipArchive(std::string data) : data_(std::move(data)) { index_central_directory(); }

ZipArchive ZipArchive::open_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open document: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ZipArchive(ss.str());
}

void ZipArchive::index_central_directory() {
    const std::size_t eocd = find_end_of_central_directory(data_);
    const std::uint16_t entry_count = read_u16(data_, eocd + 10);
    const std::uint32_t directory_offset = read_u32(data_, eocd + 16);
    if (entry_count == 0xFFFF || directory_offset == 0xFFFFFFFF) {
        throw std::runtime_error("zip: ZIP64 archives are not supported");
    }

    std::size_t pos = directory_offset;
    entries_.reserve(entry_count);
    for (std::uint16_t i = 0; i < entry_count; ++i) {
        if (read_u32(data_, pos) != kCentralDirEntrySignature) {
            throw std::runtime_error("zip: corrupt central directory");
        }
        Entry entry;
        entry.flags = read_u16(data_, pos + 8);
        entry.method = read_u16(data_, pos + 10);
        entry.crc32 = read_u32(data_, pos + 16);
        entry.compressed_size = read_u32(data_, pos + 20);
        entry.uncompressed_size = read_u32(data_, pos + 24);
        const std::uint16_t name_length = read_u16(data_, pos + 28);
        const std::uint16_t extra_length = read_u16(data_, pos + 30);
        const std::uint16_t comment_length = read_u16(data_, pos + 32);
        entry.local_header_offset = read_u32(data_, pos + 42);

        const std::size_t name_offset = pos + kCentralDirEntrySize;
        if (name_offset + name_length > data_.size()) {
            throw std::runtime_error("zip: truncated archive");
        }
        entry.name = data_.substr(name_offset, name_length);
        entries_.push_back(std::move(entry));

        pos = name_offset + name_length + extra_length + comment_length;
    }
}

const ZipArchive::Entry& ZipArchive::find_entry(const std::string& name) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
                                 [&](const Entry& entry) { return entry.name == name; });
    if (it == entries_.end()) {
        throw std::runtime_error("zip: entry not found: " + name);
    }
    return *it;
}

bool ZipArchive::contains(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const Entry& entry) { return entry.name == name; });
}

std::vector<std::string> ZipArchive::entry_names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

std::string ZipArchive::read(const std::string& name) const {
    const Entry& entry = find_entry(name);
    if (entry.flags & kFlagEncrypted) {
        throw std::runtime_error("zip: encrypted entry: " + name);
    }
    if (entry.uncompressed_size > kMaxEntrySize) {
        throw std::runtime_error("zip: entry too large: " + name);
    }

    const std::size_t header = entry.local_header_offset;
    if (read_u32(data_, header) != kLocalHeaderSignature) {
        throw std::runtime_error("zip: corrupt local header: " + name);
    }
    const std::size_t data_offset =
        header + kLocalHeaderSize + read_u16(data_, header + 26) + read_u16(data_, header + 28);
    if (data_offset + entry.compressed_size > data_.size()) {
        throw std::runtime_error("zip: truncated entry: " + name);
    }
    const char* compressed = data_.data() + data_offset;

    std::string content;
    switch (entry.method) {
        case kMethodStored:
            if (entry.compressed_size != entry.uncompressed_size) {
                throw std::runtime_error("zip: stored entry size mismatch: " + name);
            }
            content.assign(compressed, entry.compressed_size);
            break;
        case kMethodDeflated:
            content = inflate_raw(compressed, entry.compressed_size, entry.uncompressed_size);
            break;
        default: {
            std::ostringstream oss;
            oss << "zip: unsupported compression method " << entry.method << " for " << name;
            throw std::runtime_error(oss.str());
        }
    }

    const uLong crc = crc32_z(crc32(0L, Z_NULL, 0),
                              reinterpret_cast<const Bytef*>(content.data()), content.size());
    if (crc != entry.crc32) {
        throw std::runtime_error("zip: CRC mismatch for " + name);
    }
    return content;
}

}  // namespace taktkb
