#pragma once

#include "upkg/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Descriptor Parsing (metadata.xml + files.xml)
// ============================================================================

// Length of a hex-encoded SHA-1 digest
constexpr size_t HASH_HEX_LENGTH = 40;

struct MetadataParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;   // files is left empty
};

// Parse the metadata document. Accepts the PISI dialect
// (<PISI><Source/><Package/></PISI>) and the flat dialect (root element with
// Name/Summary/Description/Version/License children). Name is required.
MetadataParseResult parse_metadata_xml(const std::string& xml);

struct FileListParseResult {
    bool ok = false;
    std::string error;
    std::vector<FileEntry> files;  // Document order
};

// Parse the file list document. Every <File> must carry Path, Type, Size,
// Uid, Gid, Mode and Hash; errors name the entry index and field.
FileListParseResult parse_files_xml(const std::string& xml);

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
};

// Parse both descriptor documents into a single Manifest
ManifestParseResult parse_manifest(const std::string& metadata_xml,
                                   const std::string& files_xml);

// ============================================================================
// Field Helpers
// ============================================================================

// Parse an octal permission string ("0755", "755", "0o755"). Values above
// 07777 are rejected.
std::optional<uint32_t> parse_mode_string(const std::string& s);

// Format permission bits as four octal digits ("0755")
std::string format_mode(uint32_t mode);

// True when s is exactly `length` hex characters
bool is_hex_digest(const std::string& s, size_t length);

} // namespace upkg
