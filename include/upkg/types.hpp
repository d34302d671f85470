#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace upkg {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    ParseError,      // malformed or incomplete manifest / file list
    ArchiveError,    // corrupt or truncated archive, path traversal
    IntegrityError,  // hash mismatch (Strict) or unreadable staged content
    ConflictError,   // existing target path without force
    IOError,         // permission, disk space, missing parent
    Cancelled,
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::ParseError: return "parse_error";
        case ErrorKind::ArchiveError: return "archive_error";
        case ErrorKind::IntegrityError: return "integrity_error";
        case ErrorKind::ConflictError: return "conflict_error";
        case ErrorKind::IOError: return "io_error";
        case ErrorKind::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

// ============================================================================
// File Entries
// ============================================================================

enum class FileKind {
    Regular,
    Directory,
    Symlink,
};

inline const char* file_kind_to_string(FileKind k) {
    switch (k) {
        case FileKind::Regular: return "file";
        case FileKind::Directory: return "directory";
        case FileKind::Symlink: return "symlink";
        default: return "file";
    }
}

// Map a declared Type string to the filesystem kind it materializes as.
// Categories such as "executable", "library", "config" are regular files.
FileKind file_kind_from_type(const std::string& type);

struct FileEntry {
    std::string path;         // Normalized relative path, forward slashes
    std::string type;         // Declared category, as written in the file list
    FileKind kind = FileKind::Regular;
    uint64_t size = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint32_t mode = 0;        // Permission bits (incl. setuid/setgid/sticky)
    std::string hash;         // Lowercase hex SHA-1
};

// ============================================================================
// Manifest
// ============================================================================

struct Manifest {
    std::string name;
    std::string summary;
    std::string description;
    std::optional<std::string> version;
    std::optional<std::string> release;
    std::string architecture;
    std::string license;
    std::string homepage;
    std::string packager;     // "Name <email>"

    std::vector<FileEntry> files;  // Document order
};

// ============================================================================
// Verification Policy
// ============================================================================

enum class VerifyPolicy {
    Strict,      // Any mismatch aborts before planning
    Permissive,  // Mismatching entries are skipped and reported
};

inline const char* verify_policy_to_string(VerifyPolicy p) {
    return p == VerifyPolicy::Permissive ? "permissive" : "strict";
}

std::optional<VerifyPolicy> parse_verify_policy(const std::string& s);

// ============================================================================
// Cancellation
// ============================================================================

// Shared between the caller and a running operation. Checked between archive
// members, between verification entries and between applied actions.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
    return token != nullptr && token->is_cancelled();
}

// ============================================================================
// Warning Object
// ============================================================================

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

} // namespace upkg
