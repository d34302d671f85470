#pragma once

#include <upkg/codec.hpp>
#include <upkg/types.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace upkg::test {

// Helper to create a temporary directory
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).string(); }

private:
    std::filesystem::path path_;
};

// ============================================================================
// Raw formats
// ============================================================================

struct TarMemberSpec {
    std::string path;
    char typeflag = '0';
    std::string data;
    std::string link;
    uint32_t mode = 0644;
};

// ustar archive; names longer than 99 bytes get a GNU 'L' header
std::string build_tar(const std::vector<TarMemberSpec>& members, bool end_marker = true);

std::string gzip_compress(const std::string& data);
std::string xz_compress(const std::string& data);

// Zip with stored or deflated members
std::string build_zip(const std::vector<std::pair<std::string, std::string>>& members,
                      bool deflate = true);

std::string sha1_hex(const std::string& data);

std::string read_text(const std::string& path);
void write_text(const std::string& path, const std::string& content);
uint32_t file_mode(const std::string& path);

// Every path (files, directories, symlinks) under root, relative, sorted
std::vector<std::string> list_tree(const std::string& root);

// ============================================================================
// Bundle builder
// ============================================================================

class BundleBuilder {
public:
    BundleBuilder();

    BundleBuilder& name(const std::string& name) { name_ = name; return *this; }
    BundleBuilder& version(const std::string& version) { version_ = version; return *this; }
    BundleBuilder& compression(Compression c) { compression_ = c; return *this; }
    BundleBuilder& owner(uint32_t uid, uint32_t gid) { uid_ = uid; gid_ = gid; return *this; }

    // Declared and archived
    BundleBuilder& file(const std::string& path, const std::string& content,
                        uint32_t mode = 0644, const std::string& type = "data");
    BundleBuilder& directory(const std::string& path, uint32_t mode = 0755);
    BundleBuilder& symlink(const std::string& path, const std::string& target);

    // Declared with the hash of declared_content, archived with archived_content
    BundleBuilder& corrupted_file(const std::string& path,
                                  const std::string& declared_content,
                                  const std::string& archived_content,
                                  uint32_t mode = 0644);

    // Declared but absent from the archive
    BundleBuilder& missing_file(const std::string& path, const std::string& content);

    // Archived but not declared
    BundleBuilder& undeclared(const std::string& path, const std::string& content);

    // Arbitrary extra archive member (e.g. traversal attempts)
    BundleBuilder& raw_member(const TarMemberSpec& member);

    std::string metadata_xml() const;
    std::string files_xml() const;
    std::string tar() const;
    std::string archive_bytes() const;
    std::string archive_name() const;

    // Unpacked bundle directory; returns dir
    std::string write_directory(const std::string& dir) const;

    // .eopkg zip container; returns path
    std::string write_container(const std::string& path) const;

private:
    struct Item {
        std::string path;
        std::string type;
        FileKind kind = FileKind::Regular;
        std::string declared_content;
        std::string archived_content;
        std::string link;
        uint32_t mode = 0644;
        bool declared = true;
        bool archived = true;
    };

    std::string name_ = "example";
    std::string version_ = "1.0.0";
    Compression compression_ = Compression::Xz;
    uint32_t uid_;
    uint32_t gid_;
    std::vector<Item> items_;
    std::vector<TarMemberSpec> raw_;
};

} // namespace upkg::test
