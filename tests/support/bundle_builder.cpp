#include "bundle_builder.hpp"

#include <upkg/manifest.hpp>
#include <upkg/platform.hpp>
#include <upkg/verifier.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>
#include <unistd.h>

#include <lzma.h>
#include <zlib.h>

namespace fs = std::filesystem;

namespace upkg::test {

TempDir::TempDir() {
    path_ = fs::temp_directory_path() / ("upkg_test_" + generate_uuid());
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

// ============================================================================
// Tar
// ============================================================================

namespace {

void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

std::string make_header(const std::string& name, char typeflag, uint64_t size,
                        uint32_t mode, const std::string& link) {
    std::string block(512, '\0');
    char* h = &block[0];
    std::memcpy(h, name.data(), std::min<size_t>(name.size(), 100));
    write_octal(h + 100, 8, mode);
    write_octal(h + 108, 8, 0);
    write_octal(h + 116, 8, 0);
    write_octal(h + 124, 12, size);
    write_octal(h + 136, 12, 0);
    h[156] = typeflag;
    std::memcpy(h + 157, link.data(), std::min<size_t>(link.size(), 100));
    std::memcpy(h + 257, "ustar", 5);
    h[263] = '0';
    h[264] = '0';

    uint32_t sum = 0;
    for (size_t i = 0; i < 512; ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : static_cast<uint8_t>(block[i]);
    }
    char chksum[8];
    std::snprintf(chksum, sizeof(chksum), "%06o", sum);
    std::memcpy(h + 148, chksum, 6);
    h[154] = '\0';
    h[155] = ' ';
    return block;
}

void append_data(std::string& out, const std::string& data) {
    out += data;
    out.append((512 - data.size() % 512) % 512, '\0');
}

} // namespace

std::string build_tar(const std::vector<TarMemberSpec>& members, bool end_marker) {
    std::string out;
    for (const auto& m : members) {
        if (m.path.size() > 99) {
            std::string long_name = m.path + '\0';
            out += make_header("././@LongLink", 'L', long_name.size(), 0, "");
            append_data(out, long_name);
        }
        uint64_t size = (m.typeflag == '0') ? m.data.size() : 0;
        out += make_header(m.path, m.typeflag, size, m.mode, m.link);
        if (size > 0) {
            append_data(out, m.data);
        }
    }
    if (end_marker) {
        out.append(1024, '\0');
    }
    return out;
}

// ============================================================================
// Compression
// ============================================================================

std::string gzip_compress(const std::string& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&strm, data.size()) + 32, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("gzip compression failed");
    }
    out.resize(strm.total_out);
    return out;
}

std::string xz_compress(const std::string& data) {
    std::string out(lzma_stream_buffer_bound(data.size()), '\0');
    size_t out_pos = 0;
    lzma_ret ret = lzma_easy_buffer_encode(
        6, LZMA_CHECK_CRC64, nullptr,
        reinterpret_cast<const uint8_t*>(data.data()), data.size(),
        reinterpret_cast<uint8_t*>(&out[0]), &out_pos, out.size());
    if (ret != LZMA_OK) {
        throw std::runtime_error("xz compression failed");
    }
    out.resize(out_pos);
    return out;
}

namespace {

std::string raw_deflate(const std::string& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&strm, data.size()) + 16, '\0');
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(strm.total_out);
    return out;
}

void put16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xff));
    out.push_back(static_cast<char>((v >> 8) & 0xff));
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

} // namespace

std::string build_zip(const std::vector<std::pair<std::string, std::string>>& members, bool deflate) {
    std::string out;
    std::string central;

    for (const auto& [name, content] : members) {
        uint32_t crc = static_cast<uint32_t>(
            crc32(0, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size())));
        std::string payload = deflate ? raw_deflate(content) : content;
        uint16_t method = deflate ? 8 : 0;
        uint32_t offset = static_cast<uint32_t>(out.size());

        put32(out, 0x04034b50);
        put16(out, 20);
        put16(out, 0);
        put16(out, method);
        put16(out, 0);
        put16(out, 0);
        put32(out, crc);
        put32(out, static_cast<uint32_t>(payload.size()));
        put32(out, static_cast<uint32_t>(content.size()));
        put16(out, static_cast<uint16_t>(name.size()));
        put16(out, 0);
        out += name;
        out += payload;

        put32(central, 0x02014b50);
        put16(central, 20);
        put16(central, 20);
        put16(central, 0);
        put16(central, method);
        put16(central, 0);
        put16(central, 0);
        put32(central, crc);
        put32(central, static_cast<uint32_t>(payload.size()));
        put32(central, static_cast<uint32_t>(content.size()));
        put16(central, static_cast<uint16_t>(name.size()));
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central += name;
    }

    uint32_t cd_offset = static_cast<uint32_t>(out.size());
    out += central;
    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(members.size()));
    put16(out, static_cast<uint16_t>(members.size()));
    put32(out, static_cast<uint32_t>(central.size()));
    put32(out, cd_offset);
    put16(out, 0);
    return out;
}

std::string sha1_hex(const std::string& data) {
    auto result = compute_sha1(std::vector<uint8_t>(data.begin(), data.end()));
    if (!result.ok) {
        throw std::runtime_error(result.error);
    }
    return result.hex_digest;
}

// ============================================================================
// Filesystem helpers
// ============================================================================

std::string read_text(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

uint32_t file_mode(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<uint32_t>(st.st_mode & 07777);
}

std::vector<std::string> list_tree(const std::string& root) {
    std::vector<std::string> paths;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec); it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (ec) break;
        paths.push_back(fs::relative(it->path(), root).generic_string());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

// ============================================================================
// BundleBuilder
// ============================================================================

BundleBuilder::BundleBuilder()
    : uid_(static_cast<uint32_t>(getuid())), gid_(static_cast<uint32_t>(getgid())) {}

BundleBuilder& BundleBuilder::file(const std::string& path, const std::string& content,
                                   uint32_t mode, const std::string& type) {
    Item item;
    item.path = path;
    item.type = type;
    item.declared_content = content;
    item.archived_content = content;
    item.mode = mode;
    items_.push_back(std::move(item));
    return *this;
}

BundleBuilder& BundleBuilder::directory(const std::string& path, uint32_t mode) {
    Item item;
    item.path = path;
    item.type = "dir";
    item.kind = FileKind::Directory;
    item.mode = mode;
    items_.push_back(std::move(item));
    return *this;
}

BundleBuilder& BundleBuilder::symlink(const std::string& path, const std::string& target) {
    Item item;
    item.path = path;
    item.type = "symlink";
    item.kind = FileKind::Symlink;
    item.link = target;
    item.declared_content = target;
    item.mode = 0777;
    items_.push_back(std::move(item));
    return *this;
}

BundleBuilder& BundleBuilder::corrupted_file(const std::string& path,
                                             const std::string& declared_content,
                                             const std::string& archived_content,
                                             uint32_t mode) {
    file(path, declared_content, mode);
    items_.back().archived_content = archived_content;
    return *this;
}

BundleBuilder& BundleBuilder::missing_file(const std::string& path, const std::string& content) {
    file(path, content);
    items_.back().archived = false;
    return *this;
}

BundleBuilder& BundleBuilder::undeclared(const std::string& path, const std::string& content) {
    file(path, content);
    items_.back().declared = false;
    return *this;
}

BundleBuilder& BundleBuilder::raw_member(const TarMemberSpec& member) {
    raw_.push_back(member);
    return *this;
}

std::string BundleBuilder::metadata_xml() const {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" ?>\n"
        << "<PISI>\n"
        << "  <Source>\n"
        << "    <Name>" << name_ << "</Name>\n"
        << "    <Homepage>https://example.org/" << name_ << "</Homepage>\n"
        << "    <Packager><Name>Test Packager</Name><Email>packager@example.org</Email></Packager>\n"
        << "  </Source>\n"
        << "  <Package>\n"
        << "    <Name>" << name_ << "</Name>\n"
        << "    <Summary xml:lang=\"en\">Example package</Summary>\n"
        << "    <Description xml:lang=\"en\">Package used by the test suite</Description>\n"
        << "    <License>MIT</License>\n"
        << "    <Architecture>x86_64</Architecture>\n"
        << "    <History>\n"
        << "      <Update release=\"3\"><Date>2024-01-01</Date><Version>" << version_ << "</Version></Update>\n"
        << "      <Update release=\"2\"><Date>2023-01-01</Date><Version>0.9.0</Version></Update>\n"
        << "    </History>\n"
        << "  </Package>\n"
        << "</PISI>\n";
    return xml.str();
}

std::string BundleBuilder::files_xml() const {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" ?>\n<Files>\n";
    for (const auto& item : items_) {
        if (!item.declared) continue;
        std::string hash = item.kind == FileKind::Directory ? "" : sha1_hex(item.declared_content);
        uint64_t size = item.kind == FileKind::Regular ? item.declared_content.size() : 0;
        xml << "  <File>\n"
            << "    <Path>" << item.path << "</Path>\n"
            << "    <Type>" << item.type << "</Type>\n"
            << "    <Size>" << size << "</Size>\n"
            << "    <Uid>" << uid_ << "</Uid>\n"
            << "    <Gid>" << gid_ << "</Gid>\n"
            << "    <Mode>" << format_mode(item.mode) << "</Mode>\n"
            << "    <Hash>" << hash << "</Hash>\n"
            << "  </File>\n";
    }
    xml << "</Files>\n";
    return xml.str();
}

std::string BundleBuilder::tar() const {
    std::vector<TarMemberSpec> members;
    for (const auto& item : items_) {
        if (!item.archived) continue;
        TarMemberSpec m;
        m.path = item.path;
        m.mode = item.mode;
        switch (item.kind) {
            case FileKind::Directory:
                m.typeflag = '5';
                m.path += "/";
                break;
            case FileKind::Symlink:
                m.typeflag = '2';
                m.link = item.link;
                break;
            case FileKind::Regular:
                m.data = item.archived_content;
                break;
        }
        members.push_back(std::move(m));
    }
    members.insert(members.end(), raw_.begin(), raw_.end());
    return build_tar(members);
}

std::string BundleBuilder::archive_bytes() const {
    std::string tar_data = tar();
    switch (compression_) {
        case Compression::Xz: return xz_compress(tar_data);
        case Compression::Gzip: return gzip_compress(tar_data);
        default: return tar_data;
    }
}

std::string BundleBuilder::archive_name() const {
    switch (compression_) {
        case Compression::Xz: return "install.tar.xz";
        case Compression::Gzip: return "install.tar.gz";
        default: return "install.tar";
    }
}

std::string BundleBuilder::write_directory(const std::string& dir) const {
    write_text(dir + "/metadata.xml", metadata_xml());
    write_text(dir + "/files.xml", files_xml());
    write_text(dir + "/" + archive_name(), archive_bytes());
    return dir;
}

std::string BundleBuilder::write_container(const std::string& path) const {
    write_text(path, build_zip({
        {"metadata.xml", metadata_xml()},
        {"files.xml", files_xml()},
        {archive_name(), archive_bytes()},
    }));
    return path;
}

} // namespace upkg::test
