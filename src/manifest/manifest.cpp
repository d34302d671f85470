#include "upkg/manifest.hpp"
#include "upkg/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <unordered_set>

#include <pugixml.hpp>

namespace upkg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Child element text, falling back to an attribute of the same name.
std::optional<std::string> get_field(const pugi::xml_node& node, const char* name) {
    if (auto child = node.child(name)) {
        return trim(child.child_value());
    }
    if (auto attr = node.attribute(name)) {
        return trim(attr.value());
    }
    return std::nullopt;
}

// Localized text elements (<Summary xml:lang="en">) may repeat; prefer English.
std::string get_localized(const pugi::xml_node& node, const char* name) {
    pugi::xml_node fallback;
    for (auto child : node.children(name)) {
        std::string lang = child.attribute("xml:lang").value();
        if (lang.empty() || lang == "en") {
            return trim(child.child_value());
        }
        if (!fallback) fallback = child;
    }
    return fallback ? trim(fallback.child_value()) : std::string();
}

template <typename T>
std::optional<T> parse_unsigned(const std::string& s) {
    if (s.empty()) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, 10);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::string parse_error_message(const pugi::xml_parse_result& r, const char* document) {
    return std::string(document) + ": " + r.description() +
           " at offset " + std::to_string(r.offset);
}

std::string field_label(size_t index, const char* field) {
    return "File[" + std::to_string(index) + "]." + field;
}

} // namespace

FileKind file_kind_from_type(const std::string& type) {
    std::string t = to_lower(trim(type));
    if (t == "dir" || t == "directory") {
        return FileKind::Directory;
    }
    if (t == "symlink" || t == "link") {
        return FileKind::Symlink;
    }
    return FileKind::Regular;
}

std::optional<VerifyPolicy> parse_verify_policy(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "strict") return VerifyPolicy::Strict;
    if (lower == "permissive") return VerifyPolicy::Permissive;
    return std::nullopt;
}

std::optional<uint32_t> parse_mode_string(const std::string& s) {
    std::string digits = trim(s);
    if (digits.rfind("0o", 0) == 0 || digits.rfind("0O", 0) == 0) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 6) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
        value = (value << 3) | static_cast<uint32_t>(c - '0');
    }
    if (value > 07777) {
        return std::nullopt;
    }
    return value;
}

std::string format_mode(uint32_t mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04o", mode & 07777);
    return buf;
}

bool is_hex_digest(const std::string& s, size_t length) {
    if (s.size() != length) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

MetadataParseResult parse_metadata_xml(const std::string& xml) {
    MetadataParseResult result;

    pugi::xml_document doc;
    auto parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        result.error = parse_error_message(parsed, "metadata");
        return result;
    }

    pugi::xml_node root = doc.document_element();
    if (!root) {
        result.error = "metadata: document has no root element";
        return result;
    }

    // PISI dialect nests package fields under <Package>
    pugi::xml_node package = root.child("Package") ? root.child("Package") : root;
    pugi::xml_node source = root.child("Source");

    Manifest& m = result.manifest;

    auto name = get_field(package, "Name");
    if (!name && source) {
        name = get_field(source, "Name");
    }
    if (!name || name->empty()) {
        result.error = "metadata: required element Name is missing";
        return result;
    }
    m.name = *name;

    m.summary = get_localized(package, "Summary");
    m.description = get_localized(package, "Description");
    m.license = get_field(package, "License").value_or("");
    m.architecture = get_field(package, "Architecture").value_or("");

    if (auto version = get_field(package, "Version"); version && !version->empty()) {
        m.version = *version;
    } else if (auto history = root.child("History") ? root.child("History") : package.child("History")) {
        // The most recent update is listed first
        if (auto update = history.child("Update")) {
            if (auto v = get_field(update, "Version"); v && !v->empty()) {
                m.version = *v;
            }
            std::string release = update.attribute("release").value();
            if (!release.empty()) {
                m.release = release;
            }
        }
    }

    if (source) {
        m.homepage = get_field(source, "Homepage").value_or("");
        if (auto packager = source.child("Packager")) {
            std::string pname = get_field(packager, "Name").value_or("");
            std::string email = get_field(packager, "Email").value_or("");
            m.packager = email.empty() ? pname : pname + " <" + email + ">";
        }
    } else {
        m.homepage = get_field(package, "Homepage").value_or("");
    }

    result.ok = true;
    return result;
}

FileListParseResult parse_files_xml(const std::string& xml) {
    FileListParseResult result;

    pugi::xml_document doc;
    auto parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        result.error = parse_error_message(parsed, "files");
        return result;
    }

    pugi::xml_node root = doc.document_element();
    if (!root) {
        result.error = "files: document has no root element";
        return result;
    }

    std::unordered_set<std::string> seen;
    size_t index = 0;

    for (pugi::xml_node node : root.children("File")) {
        FileEntry entry;

        auto require = [&](const char* field) -> std::optional<std::string> {
            auto value = get_field(node, field);
            if (!value) {
                result.error = "files: " + field_label(index, field) + " is missing";
            }
            return value;
        };

        auto path = require("Path");
        if (!path) return result;
        auto normalized = normalize_relative_path(*path);
        if (!normalized.ok) {
            result.error = "files: " + field_label(index, "Path") + " '" + *path + "': " +
                           path_error_to_string(normalized.error);
            return result;
        }
        entry.path = normalized.path;
        if (!seen.insert(entry.path).second) {
            result.error = "files: " + field_label(index, "Path") + " duplicate path '" +
                           entry.path + "'";
            return result;
        }

        auto type = require("Type");
        if (!type) return result;
        entry.type = *type;
        entry.kind = file_kind_from_type(*type);

        auto size = require("Size");
        if (!size) return result;
        auto size_value = parse_unsigned<uint64_t>(*size);
        if (!size_value) {
            result.error = "files: " + field_label(index, "Size") + " invalid value '" + *size + "'";
            return result;
        }
        entry.size = *size_value;

        auto uid = require("Uid");
        if (!uid) return result;
        auto uid_value = parse_unsigned<uint32_t>(*uid);
        if (!uid_value) {
            result.error = "files: " + field_label(index, "Uid") + " invalid value '" + *uid + "'";
            return result;
        }
        entry.uid = *uid_value;

        auto gid = require("Gid");
        if (!gid) return result;
        auto gid_value = parse_unsigned<uint32_t>(*gid);
        if (!gid_value) {
            result.error = "files: " + field_label(index, "Gid") + " invalid value '" + *gid + "'";
            return result;
        }
        entry.gid = *gid_value;

        auto mode = require("Mode");
        if (!mode) return result;
        auto mode_value = parse_mode_string(*mode);
        if (!mode_value) {
            result.error = "files: " + field_label(index, "Mode") + " invalid value '" + *mode + "'";
            return result;
        }
        entry.mode = *mode_value;

        auto hash = require("Hash");
        if (!hash) return result;
        std::string hash_value = to_lower(*hash);
        bool hash_optional = entry.kind == FileKind::Directory && hash_value.empty();
        if (!hash_optional && !is_hex_digest(hash_value, HASH_HEX_LENGTH)) {
            result.error = "files: " + field_label(index, "Hash") + " '" + *hash +
                           "' is not a " + std::to_string(HASH_HEX_LENGTH) + "-character hex digest";
            return result;
        }
        entry.hash = hash_value;

        result.files.push_back(std::move(entry));
        ++index;
    }

    // A declared symlink may not stand in for a directory of another entry
    std::unordered_set<std::string> symlinks;
    for (const auto& entry : result.files) {
        if (entry.kind == FileKind::Symlink) {
            symlinks.insert(entry.path);
        }
    }
    for (size_t i = 0; i < result.files.size() && !symlinks.empty(); ++i) {
        const std::string& path = result.files[i].path;
        for (size_t slash = path.find('/'); slash != std::string::npos;
             slash = path.find('/', slash + 1)) {
            std::string ancestor = path.substr(0, slash);
            if (symlinks.count(ancestor)) {
                result.files.clear();
                result.error = "files: " + field_label(i, "Path") + " '" + path +
                               "' is beneath declared symlink '" + ancestor + "'";
                return result;
            }
        }
    }

    result.ok = true;
    return result;
}

ManifestParseResult parse_manifest(const std::string& metadata_xml,
                                   const std::string& files_xml) {
    ManifestParseResult result;

    auto metadata = parse_metadata_xml(metadata_xml);
    if (!metadata.ok) {
        result.error = metadata.error;
        return result;
    }

    auto files = parse_files_xml(files_xml);
    if (!files.ok) {
        result.error = files.error;
        return result;
    }

    result.manifest = std::move(metadata.manifest);
    result.manifest.files = std::move(files.files);
    result.ok = true;
    return result;
}

} // namespace upkg
