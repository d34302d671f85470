#include "upkg/bundle.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

#include <zlib.h>

namespace upkg {

namespace {

constexpr uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr uint32_t CENTRAL_SIGNATURE = 0x02014b50;
constexpr uint32_t LOCAL_SIGNATURE = 0x04034b50;
constexpr size_t EOCD_SIZE = 22;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t MAX_COMMENT = 0xffff;
constexpr uint32_t ZIP64_MARKER = 0xffffffff;

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool read_at(std::ifstream& file, uint64_t offset, uint8_t* buf, size_t len) {
    file.clear();
    file.seekg(static_cast<std::streamoff>(offset));
    if (!file) return false;
    file.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return static_cast<size_t>(file.gcount()) == len;
}

} // namespace

ZipIndexResult read_zip_index(const std::string& zip_path) {
    ZipIndexResult result;

    std::ifstream file(zip_path, std::ios::binary | std::ios::ate);
    if (!file) {
        result.error = "failed to open container: " + zip_path;
        return result;
    }
    uint64_t file_size = static_cast<uint64_t>(file.tellg());
    if (file_size < EOCD_SIZE) {
        result.error = "not a zip container (too small): " + zip_path;
        return result;
    }

    // The end-of-central-directory record sits before an optional comment
    size_t tail_size = static_cast<size_t>(std::min<uint64_t>(file_size, EOCD_SIZE + MAX_COMMENT));
    std::vector<uint8_t> tail(tail_size);
    if (!read_at(file, file_size - tail_size, tail.data(), tail_size)) {
        result.error = "failed to read container: " + zip_path;
        return result;
    }

    size_t eocd = std::string::npos;
    for (size_t i = tail_size - EOCD_SIZE + 1; i-- > 0;) {
        if (le32(&tail[i]) == EOCD_SIGNATURE) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        result.error = "not a zip container (no end of central directory): " + zip_path;
        return result;
    }

    uint16_t entry_count = le16(&tail[eocd + 10]);
    uint32_t cd_size = le32(&tail[eocd + 12]);
    uint32_t cd_offset = le32(&tail[eocd + 16]);
    if (cd_offset == ZIP64_MARKER || cd_size == ZIP64_MARKER) {
        result.error = "zip64 containers are not supported: " + zip_path;
        return result;
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > file_size) {
        result.error = "corrupt container: central directory out of range";
        return result;
    }

    std::vector<uint8_t> cd(cd_size);
    if (cd_size > 0 && !read_at(file, cd_offset, cd.data(), cd_size)) {
        result.error = "failed to read central directory: " + zip_path;
        return result;
    }

    size_t pos = 0;
    for (uint16_t i = 0; i < entry_count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > cd.size() || le32(&cd[pos]) != CENTRAL_SIGNATURE) {
            result.error = "corrupt container: bad central directory entry " + std::to_string(i);
            return result;
        }
        const uint8_t* h = &cd[pos];
        ZipEntry entry;
        entry.method = le16(h + 10);
        entry.crc32 = le32(h + 16);
        uint32_t csize = le32(h + 20);
        uint32_t usize = le32(h + 24);
        uint16_t name_len = le16(h + 28);
        uint16_t extra_len = le16(h + 30);
        uint16_t comment_len = le16(h + 32);
        uint32_t local_offset = le32(h + 42);

        if (csize == ZIP64_MARKER || usize == ZIP64_MARKER || local_offset == ZIP64_MARKER) {
            result.error = "zip64 containers are not supported: " + zip_path;
            return result;
        }
        if (pos + CENTRAL_HEADER_SIZE + name_len > cd.size()) {
            result.error = "corrupt container: truncated entry name";
            return result;
        }

        entry.name.assign(reinterpret_cast<const char*>(h + CENTRAL_HEADER_SIZE), name_len);
        entry.compressed_size = csize;
        entry.uncompressed_size = usize;
        entry.local_header_offset = local_offset;
        result.entries.push_back(std::move(entry));

        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
    }

    result.ok = true;
    return result;
}

std::unique_ptr<ByteSource> open_zip_entry(const std::string& zip_path,
                                           const ZipEntry& entry,
                                           std::string& error) {
    if (entry.method != 0 && entry.method != 8) {
        error = "unsupported compression method " + std::to_string(entry.method) +
                " for container member " + entry.name;
        return nullptr;
    }

    std::ifstream file(zip_path, std::ios::binary);
    uint8_t local[LOCAL_HEADER_SIZE];
    if (!file || !read_at(file, entry.local_header_offset, local, sizeof(local)) ||
        le32(local) != LOCAL_SIGNATURE) {
        error = "corrupt container: bad local header for " + entry.name;
        return nullptr;
    }

    uint64_t data_offset = entry.local_header_offset + LOCAL_HEADER_SIZE +
                           le16(local + 26) + le16(local + 28);

    auto raw = std::make_unique<FileByteSource>(zip_path, data_offset, entry.compressed_size);
    if (!raw->is_open()) {
        error = raw->error();
        return nullptr;
    }
    if (entry.method == 8) {
        return make_decoder(Compression::RawDeflate, std::move(raw));
    }
    return raw;
}

std::optional<std::string> read_zip_entry(const std::string& zip_path,
                                          const ZipEntry& entry,
                                          std::string& error) {
    auto source = open_zip_entry(zip_path, entry, error);
    if (!source) {
        return std::nullopt;
    }

    std::string content;
    uint8_t buf[16384];
    for (;;) {
        std::ptrdiff_t n = source->read(buf, sizeof(buf));
        if (n < 0) {
            error = "failed to read container member " + entry.name + ": " + source->error();
            return std::nullopt;
        }
        if (n == 0) break;
        content.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(n));
    }

    if (content.size() != entry.uncompressed_size) {
        error = "container member " + entry.name + " is truncated";
        return std::nullopt;
    }

    uint32_t crc = static_cast<uint32_t>(
        crc32(0, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size())));
    if (crc != entry.crc32) {
        error = "container member " + entry.name + " fails its CRC check";
        return std::nullopt;
    }
    return content;
}

} // namespace upkg
