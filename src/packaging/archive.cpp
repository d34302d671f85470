#include "upkg/archive.hpp"
#include "upkg/path_utils.hpp"
#include "upkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace upkg {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_PREFIX_SIZE = 155;

// Extension headers are small; anything larger is treated as corrupt
static constexpr uint64_t MAX_EXTENSION_SIZE = 1024 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];         // 0
    char mode[8];                     // 100
    char uid[8];                      // 108
    char gid[8];                      // 116
    char size[12];                    // 124
    char mtime[12];                   // 136
    char chksum[8];                   // 148
    char typeflag;                    // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[6];                    // 257
    char version[2];                  // 263
    char uname[32];                   // 265
    char gname[32];                   // 297
    char devmajor[8];                 // 329
    char devminor[8];                 // 337
    char prefix[TAR_PREFIX_SIZE];     // 345
    char padding[12];                 // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

// Numeric field: octal text, or base-256 when the high bit is set (GNU)
bool parse_numeric(const char* data, size_t size, uint64_t& out) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    if (bytes[0] & 0x80) {
        uint64_t value = bytes[0] & 0x7f;
        for (size_t i = 1; i < size; ++i) {
            if (value >> 56) return false;
            value = (value << 8) | bytes[i];
        }
        out = value;
        return true;
    }

    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    uint64_t value = 0;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] < '0' || data[i] > '7') {
            return false;
        }
        value = (value << 3) | static_cast<uint64_t>(data[i] - '0');
    }
    out = value;
    return true;
}

bool checksum_matches(const uint8_t* block) {
    const auto* header = reinterpret_cast<const TarHeader*>(block);
    uint64_t stored = 0;
    if (!parse_numeric(header->chksum, sizeof(header->chksum), stored)) {
        return false;
    }
    // Historic writers summed signed chars; accept either
    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        uint8_t b = (i >= 148 && i < 156) ? static_cast<uint8_t>(' ') : block[i];
        unsigned_sum += b;
        signed_sum += static_cast<signed char>(b);
    }
    return stored == unsigned_sum || static_cast<int64_t>(stored) == signed_sum;
}

bool is_zero_block(const uint8_t* block) {
    return std::all_of(block, block + TAR_BLOCK_SIZE, [](uint8_t b) { return b == 0; });
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

MemberType member_type_from_flag(char typeflag) {
    switch (typeflag) {
        case '0':
        case '\0':
        case '7':
            return MemberType::Regular;
        case '1': return MemberType::Hardlink;
        case '2': return MemberType::Symlink;
        case '3': return MemberType::CharDevice;
        case '4': return MemberType::BlockDevice;
        case '5': return MemberType::Directory;
        case '6': return MemberType::Fifo;
        default: return MemberType::Other;
    }
}

// pax records: "<len> <key>=<value>\n"
bool parse_pax_records(const std::string& data,
                       std::string& path,
                       std::string& linkpath,
                       std::optional<uint64_t>& size) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) return false;
        uint64_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return false;
            len = len * 10 + static_cast<uint64_t>(data[i] - '0');
        }
        if (len == 0 || pos + len > data.size() || data[pos + len - 1] != '\n') {
            return false;
        }
        std::string record = data.substr(space + 1, pos + len - space - 2);
        size_t eq = record.find('=');
        if (eq == std::string::npos) return false;
        std::string key = record.substr(0, eq);
        std::string value = record.substr(eq + 1);
        if (key == "path") {
            path = value;
        } else if (key == "linkpath") {
            linkpath = value;
        } else if (key == "size") {
            uint64_t v = 0;
            for (char c : value) {
                if (c < '0' || c > '9') return false;
                v = v * 10 + static_cast<uint64_t>(c - '0');
            }
            size = v;
        }
        pos += len;
    }
    return true;
}

} // namespace

const char* member_type_to_string(MemberType t) {
    switch (t) {
        case MemberType::Regular: return "file";
        case MemberType::Directory: return "directory";
        case MemberType::Symlink: return "symlink";
        case MemberType::Hardlink: return "hardlink";
        case MemberType::CharDevice: return "character device";
        case MemberType::BlockDevice: return "block device";
        case MemberType::Fifo: return "fifo";
        default: return "unknown";
    }
}

// ============================================================================
// TarReader
// ============================================================================

bool TarReader::read_block(uint8_t* block, bool* eof) {
    bool short_read = false;
    if (!read_exact(source_, block, TAR_BLOCK_SIZE, &short_read)) {
        if (short_read) {
            *eof = true;
        } else {
            error_ = source_.error();
        }
        return false;
    }
    return true;
}

bool TarReader::skip_remaining() {
    uint8_t buf[8192];
    uint64_t total = data_remaining_ + padding_remaining_;
    while (total > 0) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(total, sizeof(buf)));
        bool short_read = false;
        if (!read_exact(source_, buf, chunk, &short_read)) {
            error_ = short_read ? "truncated archive: unexpected end of member data"
                                : source_.error();
            return false;
        }
        total -= chunk;
    }
    data_remaining_ = 0;
    padding_remaining_ = 0;
    return true;
}

bool TarReader::read_extension(uint64_t size, std::string& out) {
    if (size > MAX_EXTENSION_SIZE) {
        error_ = "extended header too large";
        return false;
    }
    out.assign(static_cast<size_t>(size), '\0');
    bool short_read = false;
    if (size > 0 &&
        !read_exact(source_, reinterpret_cast<uint8_t*>(&out[0]), out.size(), &short_read)) {
        error_ = short_read ? "truncated archive: unexpected end of extended header"
                            : source_.error();
        return false;
    }
    data_remaining_ = 0;
    padding_remaining_ = (TAR_BLOCK_SIZE - (size % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
    return skip_remaining();
}

TarReader::Status TarReader::next(TarMember& member) {
    if (!skip_remaining()) {
        return Status::Error;
    }

    std::string long_name;
    std::string long_link;
    std::string pax_path;
    std::string pax_link;
    std::optional<uint64_t> pax_size;

    for (;;) {
        uint8_t block[TAR_BLOCK_SIZE];
        bool eof = false;
        if (!read_block(block, &eof)) {
            if (eof) {
                error_ = "truncated archive: missing end-of-archive marker";
            }
            return Status::Error;
        }

        if (is_zero_block(block)) {
            // The marker is two zero blocks; tolerate writers that emit one
            uint8_t second[TAR_BLOCK_SIZE];
            bool second_eof = false;
            if (!read_block(second, &second_eof) && !second_eof) {
                return Status::Error;
            }
            return Status::End;
        }

        if (!checksum_matches(block)) {
            error_ = "corrupt archive: header checksum mismatch";
            return Status::Error;
        }

        const auto* header = reinterpret_cast<const TarHeader*>(block);
        uint64_t size = 0;
        if (!parse_numeric(header->size, sizeof(header->size), size)) {
            error_ = "corrupt archive: invalid size field";
            return Status::Error;
        }

        char typeflag = header->typeflag;
        if (typeflag == 'x' || typeflag == 'g' || typeflag == 'L' || typeflag == 'K') {
            std::string data;
            if (!read_extension(size, data)) {
                return Status::Error;
            }
            if (typeflag == 'L') {
                long_name = data.substr(0, strnlen(data.c_str(), data.size()));
            } else if (typeflag == 'K') {
                long_link = data.substr(0, strnlen(data.c_str(), data.size()));
            } else if (typeflag == 'x') {
                if (!parse_pax_records(data, pax_path, pax_link, pax_size)) {
                    error_ = "corrupt archive: malformed pax header";
                    return Status::Error;
                }
            }
            continue;
        }

        member = TarMember();
        member.typeflag = typeflag;
        member.type = member_type_from_flag(typeflag);

        if (!pax_path.empty()) {
            member.path = pax_path;
        } else if (!long_name.empty()) {
            member.path = long_name;
        } else {
            std::string name = field_string(header->name, TAR_NAME_SIZE);
            std::string prefix;
            if (std::memcmp(header->magic, "ustar", 5) == 0) {
                prefix = field_string(header->prefix, TAR_PREFIX_SIZE);
            }
            member.path = prefix.empty() ? name : prefix + "/" + name;
        }

        if (!pax_link.empty()) {
            member.link_target = pax_link;
        } else if (!long_link.empty()) {
            member.link_target = long_link;
        } else {
            member.link_target = field_string(header->linkname, TAR_LINKNAME_SIZE);
        }

        uint64_t mode = 0;
        parse_numeric(header->mode, sizeof(header->mode), mode);
        member.mode = static_cast<uint32_t>(mode & 07777);
        member.size = pax_size ? *pax_size : size;

        // Only regular members carry data
        if (member.type != MemberType::Regular) {
            member.size = member.type == MemberType::Directory ? 0 : member.size;
        }
        data_remaining_ = member.size;
        padding_remaining_ = (TAR_BLOCK_SIZE - (member.size % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
        return Status::Member;
    }
}

std::ptrdiff_t TarReader::read_data(uint8_t* buf, size_t len) {
    if (data_remaining_ == 0) {
        return 0;
    }
    len = static_cast<size_t>(std::min<uint64_t>(len, data_remaining_));
    std::ptrdiff_t n = source_.read(buf, len);
    if (n < 0) {
        error_ = source_.error();
        return -1;
    }
    if (n == 0) {
        error_ = "truncated archive: unexpected end of member data";
        return -1;
    }
    data_remaining_ -= static_cast<uint64_t>(n);
    return n;
}

// ============================================================================
// Safe Extraction
// ============================================================================

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    if (!entry_path.empty() && entry_path[0] == '/') {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    auto normalized = normalize_relative_path(entry_path);
    if (!normalized.ok) {
        if (normalized.error == PathError::EscapesRoot) {
            result.error = "path traversal not allowed: " + entry_path;
        } else {
            result.error = std::string(path_error_to_string(normalized.error)) + ": " + entry_path;
        }
        return result;
    }

    auto under_root = normalize_under_root(extraction_root, normalized.path);
    if (!under_root.ok) {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = normalized.path;
    return result;
}

namespace {

bool write_member_file(TarReader& reader, const std::string& path, std::string& error) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        error = "failed to create " + path + ": " + std::string(strerror(errno));
        return false;
    }

    uint8_t buffer[65536];
    for (;;) {
        std::ptrdiff_t n = reader.read_data(buffer, sizeof(buffer));
        if (n < 0) {
            error = reader.error();
            close(fd);
            return false;
        }
        if (n == 0) break;
        const uint8_t* p = buffer;
        size_t left = static_cast<size_t>(n);
        while (left > 0) {
            ssize_t w = write(fd, p, left);
            if (w < 0) {
                if (errno == EINTR) continue;
                error = "failed to write " + path + ": " + std::string(strerror(errno));
                close(fd);
                return false;
            }
            p += w;
            left -= static_cast<size_t>(w);
        }
    }

    if (close(fd) != 0) {
        error = "failed to close " + path + ": " + std::string(strerror(errno));
        return false;
    }
    return true;
}

} // namespace

ExtractResult extract_archive_safe(ByteSource& source,
                                   const std::string& staging_dir,
                                   const CancellationToken* cancel) {
    ExtractResult result;

    if (!create_directories(staging_dir)) {
        result.error = "failed to create staging directory: " + staging_dir;
        return result;
    }

    TarReader reader(source);

    for (;;) {
        if (is_cancelled(cancel)) {
            result.cancelled = true;
            result.error = "operation cancelled during extraction";
            return result;
        }

        TarMember member;
        auto status = reader.next(member);
        if (status == TarReader::Status::Error) {
            result.error = reader.error();
            return result;
        }
        if (status == TarReader::Status::End) {
            break;
        }

        std::string path = member.path;
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        if (path.rfind("./", 0) == 0) {
            path = path.substr(2);
        }
        if (path.empty() || path == ".") {
            continue;
        }

        auto validation = validate_extraction_path(path, staging_dir);
        if (!validation.safe) {
            result.error = validation.error;
            return result;
        }
        const std::string& rel = validation.normalized_path;

        switch (member.type) {
            case MemberType::Regular:
            case MemberType::Directory:
            case MemberType::Symlink:
                break;
            case MemberType::Other:
                result.error = "unsupported member type '" + std::string(1, member.typeflag) +
                               "': " + path;
                return result;
            default:
                result.error = std::string(member_type_to_string(member.type)) +
                               " members are not permitted: " + path;
                return result;
        }

        std::string offender;
        if (!parent_chain_is_plain(staging_dir, rel, offender)) {
            result.error = "member path passes through symlink '" + offender + "': " + path;
            return result;
        }

        std::string full_path = join_path(staging_dir, rel);
        std::string parent = get_parent_directory(full_path);

        if (member.type == MemberType::Directory) {
            if (path_exists(full_path) && (is_symlink(full_path) || !is_directory(full_path))) {
                result.error = "directory member collides with existing entry: " + path;
                return result;
            }
            if (!create_directories(full_path)) {
                result.error = "failed to create directory: " + path;
                return result;
            }
            if (chmod(full_path.c_str(), 0700) != 0) {
                result.error = "failed to restrict permissions on " + path + ": " +
                               std::string(strerror(errno));
                return result;
            }
        } else {
            if (!parent.empty() && !create_directories(parent)) {
                result.error = "failed to create parent directory for: " + path;
                return result;
            }
            // A later member replaces an earlier one of the same name
            if (path_exists(full_path)) {
                if (is_directory(full_path) && !is_symlink(full_path)) {
                    result.error = "member collides with existing directory: " + path;
                    return result;
                }
                remove_file(full_path);
            }

            if (member.type == MemberType::Symlink) {
                if (member.link_target.empty()) {
                    result.error = "symlink member has empty target: " + path;
                    return result;
                }
                if (symlink(member.link_target.c_str(), full_path.c_str()) != 0) {
                    result.error = "failed to create symlink " + path + ": " +
                                   std::string(strerror(errno));
                    return result;
                }
            } else {
                std::string error;
                if (!write_member_file(reader, full_path, error)) {
                    result.error = error;
                    return result;
                }
            }
        }

        spdlog::debug("extracted {} ({}, {} bytes)", rel, member_type_to_string(member.type), member.size);

        ExtractedMember extracted;
        extracted.path = rel;
        extracted.type = member.type;
        extracted.size = member.size;
        result.members.push_back(std::move(extracted));
    }

    result.ok = true;
    return result;
}

} // namespace upkg
