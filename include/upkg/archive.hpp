#pragma once

#include "upkg/codec.hpp"
#include "upkg/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Tar Members
// ============================================================================

enum class MemberType {
    Regular,
    Directory,
    Symlink,
    Hardlink,
    CharDevice,
    BlockDevice,
    Fifo,
    Other,
};

const char* member_type_to_string(MemberType t);

struct TarMember {
    std::string path;         // as recorded (pax/GNU long name applied)
    MemberType type = MemberType::Regular;
    char typeflag = '0';
    uint64_t size = 0;
    uint32_t mode = 0;
    std::string link_target;
};

// Streaming POSIX ustar / GNU / pax reader over a ByteSource.
// Extended headers (pax 'x', GNU 'L'/'K') are folded into the member they
// describe; pax global headers are skipped.
class TarReader {
public:
    enum class Status {
        Member,
        End,    // end-of-archive marker reached
        Error,
    };

    explicit TarReader(ByteSource& source) : source_(source) {}

    // Advance to the next member, skipping any unread data of the current one
    Status next(TarMember& member);

    // Read data of the current member. Returns 0 when the member is exhausted.
    std::ptrdiff_t read_data(uint8_t* buf, size_t len);

    const std::string& error() const { return error_; }

private:
    bool skip_remaining();
    bool read_block(uint8_t* block, bool* eof);
    bool read_extension(uint64_t size, std::string& out);

    ByteSource& source_;
    uint64_t data_remaining_ = 0;
    uint64_t padding_remaining_ = 0;
    std::string error_;
};

// ============================================================================
// Safe Extraction
// ============================================================================

struct PathValidation {
    bool safe = false;
    std::string normalized_path;
    std::string error;
};

// Reject absolute paths and paths that escape extraction_root
PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root);

struct ExtractedMember {
    std::string path;  // normalized, relative to the staging root
    MemberType type = MemberType::Regular;
    uint64_t size = 0;
};

struct ExtractResult {
    bool ok = false;
    bool cancelled = false;
    std::string error;
    std::vector<ExtractedMember> members;  // archive order
};

// Stream every member of a tar archive into staging_dir.
// Files are created owner-only; hardlinks, devices and FIFOs are rejected,
// as is any member whose parent inside staging_dir is a symlink.
ExtractResult extract_archive_safe(ByteSource& source,
                                   const std::string& staging_dir,
                                   const CancellationToken* cancel = nullptr);

} // namespace upkg
