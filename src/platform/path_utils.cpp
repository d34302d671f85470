#include "upkg/path_utils.hpp"
#include "upkg/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace upkg {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

// Collapse "." and ".." without leaving the starting point.
bool collapse_components(const std::string& path, std::vector<std::string>& out) {
    for (const auto& part : split(to_portable_path(path), '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (out.empty()) {
                return false;
            }
            out.pop_back();
        } else {
            out.push_back(part);
        }
    }
    return true;
}

} // namespace

const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "ok";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
        default: return "invalid path";
    }
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string input = relative_path;
    if (!input.empty() && (input[0] == '/' || input[0] == '\\')) {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        while (!input.empty() && (input[0] == '/' || input[0] == '\\')) {
            input.erase(input.begin());
        }
    }

    std::vector<std::string> normalized;
    if (!collapse_components(input, normalized)) {
        return {false, {}, PathError::EscapesRoot};
    }

    std::string out = join_components(root, normalized);
    // Ensure containment: lexically compare without touching filesystem.
    std::filesystem::path root_path(root);
    std::filesystem::path out_path(out);
    auto lex_root = root_path.lexically_normal();
    auto lex_out = out_path.lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        // A trailing separator on root shows up as an empty final component
        if (root_it->empty()) break;
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

PathResult normalize_relative_path(const std::string& relative_path) {
    if (relative_path.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (relative_path[0] == '/' || relative_path[0] == '\\') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    if (!collapse_components(relative_path, normalized)) {
        return {false, {}, PathError::EscapesRoot};
    }
    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    std::string out;
    for (const auto& c : normalized) {
        if (!out.empty()) out += '/';
        out += c;
    }
    return {true, out, PathError::None};
}

bool parent_chain_is_plain(const std::string& root, const std::string& rel, std::string& offender) {
    std::string current = root;
    size_t start = 0;
    for (;;) {
        size_t slash = rel.find('/', start);
        if (slash == std::string::npos) {
            return true;
        }
        current = join_path(current, rel.substr(start, slash - start));
        struct stat st;
        if (lstat(current.c_str(), &st) == 0 && S_ISLNK(st.st_mode)) {
            offender = rel.substr(0, slash);
            return false;
        }
        start = slash + 1;
    }
}

} // namespace upkg
