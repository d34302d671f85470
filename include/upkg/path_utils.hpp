#pragma once

#include <string>

namespace upkg {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError e);

struct PathResult {
    bool ok;
    std::string path;  // normalized path when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// Normalize a bundle-internal relative path ("./a//b/" -> "a/b").
// Same rules as normalize_under_root; the result stays relative.
PathResult normalize_relative_path(const std::string& relative_path);

// Fail if any existing component of rel's parent chain under root is a
// symlink. offender receives the first such component, relative to root.
bool parent_chain_is_plain(const std::string& root, const std::string& rel, std::string& offender);

} // namespace upkg
