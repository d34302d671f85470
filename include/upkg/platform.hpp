#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Copy src to a temporary sibling of dst, fsync it, then rename over dst.
// The temporary is created with owner-only permissions.
AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst);

// Create (or replace) a symlink at link_path via temp name + rename
AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists (does not follow a final symlink)
bool path_exists(const std::string& path);

// Check if a path is a directory (follows symlinks)
bool is_directory(const std::string& path);

// Check if a path is a regular file (follows symlinks)
bool is_regular_file(const std::string& path);

// Check if a path is a symlink
bool is_symlink(const std::string& path);

// Read symlink target
std::optional<std::string> read_symlink(const std::string& path);

// Create directories recursively; existing directories are not an error
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file or symlink
bool remove_file(const std::string& path);

// Read a whole file
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace upkg
