#pragma once

#include "upkg/codec.hpp"
#include "upkg/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Bundle Layout
// ============================================================================

constexpr const char* METADATA_DOCUMENT = "metadata.xml";
constexpr const char* FILES_DOCUMENT = "files.xml";

// Content archive names, in lookup order
const std::vector<std::string>& content_archive_names();

// ============================================================================
// Zip Container (.eopkg)
// ============================================================================

struct ZipEntry {
    std::string name;
    uint16_t method = 0;            // 0 = stored, 8 = deflate
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
};

struct ZipIndexResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;  // central directory order
};

// Read the central directory of a zip file
ZipIndexResult read_zip_index(const std::string& zip_path);

// Open the uncompressed payload of one entry as a stream.
// Returns nullptr and sets error on failure.
std::unique_ptr<ByteSource> open_zip_entry(const std::string& zip_path,
                                           const ZipEntry& entry,
                                           std::string& error);

// Read a whole (small) entry into memory
std::optional<std::string> read_zip_entry(const std::string& zip_path,
                                          const ZipEntry& entry,
                                          std::string& error);

// ============================================================================
// Package Bundle
// ============================================================================

enum class BundleKind {
    Directory,  // unpacked: metadata.xml, files.xml, install.tar.* side by side
    Container,  // .eopkg zip holding the same members
};

inline const char* bundle_kind_to_string(BundleKind k) {
    return k == BundleKind::Container ? "container" : "directory";
}

struct ContentArchive {
    std::string name;  // e.g. "install.tar.xz"
    Compression compression = Compression::None;
    uint64_t stored_size = 0;

    // Opens a fresh stream of the archive bytes as stored (still compressed)
    std::function<std::unique_ptr<ByteSource>(std::string& error)> open_raw;

    // Opens a fresh stream of the decompressed tar bytes
    std::unique_ptr<ByteSource> open(std::string& error) const;
};

struct PackageBundle {
    std::string source_path;
    BundleKind kind = BundleKind::Directory;
    Manifest manifest;
    ContentArchive archive;
};

struct BundleOpenResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    PackageBundle bundle;
};

// Open a bundle directory or .eopkg container and parse its manifest
BundleOpenResult open_bundle(const std::string& path);

} // namespace upkg
