#include "upkg/codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <lzma.h>
#include <zlib.h>

namespace upkg {

namespace {

constexpr size_t INPUT_CHUNK = 64 * 1024;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

// ============================================================================
// FileByteSource
// ============================================================================

FileByteSource::FileByteSource(const std::string& path, uint64_t offset, uint64_t length)
    : remaining_(length) {
    fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        error_ = "failed to open " + path + ": " + std::string(strerror(errno));
        return;
    }
    if (offset > 0 && lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
        error_ = "failed to seek in " + path + ": " + std::string(strerror(errno));
        close(fd_);
        fd_ = -1;
    }
}

FileByteSource::~FileByteSource() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::ptrdiff_t FileByteSource::read(uint8_t* buf, size_t len) {
    if (fd_ < 0) {
        if (error_.empty()) error_ = "source is not open";
        return -1;
    }
    if (remaining_ == 0) {
        return 0;
    }
    if (remaining_ != npos) {
        len = static_cast<size_t>(std::min<uint64_t>(len, remaining_));
    }
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            error_ = "read failed: " + std::string(strerror(errno));
            return -1;
        }
        if (remaining_ != npos) {
            remaining_ -= static_cast<uint64_t>(n);
        }
        return n;
    }
}

std::ptrdiff_t MemoryByteSource::read(uint8_t* buf, size_t len) {
    size_t n = std::min(len, data_.size() - pos_);
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return static_cast<std::ptrdiff_t>(n);
}

// ============================================================================
// Compression Detection
// ============================================================================

const char* compression_to_string(Compression c) {
    switch (c) {
        case Compression::None: return "none";
        case Compression::Gzip: return "gzip";
        case Compression::Xz: return "xz";
        case Compression::RawDeflate: return "deflate";
        default: return "none";
    }
}

Compression compression_from_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ends_with(lower, ".xz") || ends_with(lower, ".txz")) {
        return Compression::Xz;
    }
    if (ends_with(lower, ".gz") || ends_with(lower, ".tgz")) {
        return Compression::Gzip;
    }
    return Compression::None;
}

// ============================================================================
// InflateSource (zlib)
// ============================================================================

struct InflateSource::State {
    z_stream strm;
    bool initialized = false;
    bool finished = false;
    bool input_eof = false;
    uint8_t input[INPUT_CHUNK];
};

InflateSource::InflateSource(std::unique_ptr<ByteSource> inner, bool gzip_framing)
    : inner_(std::move(inner)), state_(std::make_unique<State>()) {
    std::memset(&state_->strm, 0, sizeof(state_->strm));
    // 16 + MAX_WBITS selects gzip framing, negative bits select raw deflate
    int window_bits = gzip_framing ? 16 + MAX_WBITS : -MAX_WBITS;
    if (inflateInit2(&state_->strm, window_bits) != Z_OK) {
        error_ = "inflateInit2 failed";
        return;
    }
    state_->initialized = true;
}

InflateSource::~InflateSource() {
    if (state_ && state_->initialized) {
        inflateEnd(&state_->strm);
    }
}

std::ptrdiff_t InflateSource::read(uint8_t* buf, size_t len) {
    if (!state_->initialized) {
        return -1;
    }
    if (state_->finished || len == 0) {
        return 0;
    }

    z_stream& strm = state_->strm;
    strm.next_out = buf;
    strm.avail_out = static_cast<uInt>(std::min<size_t>(len, 1u << 30));

    while (strm.avail_out > 0) {
        if (strm.avail_in == 0 && !state_->input_eof) {
            std::ptrdiff_t n = inner_->read(state_->input, sizeof(state_->input));
            if (n < 0) {
                error_ = inner_->error();
                return -1;
            }
            if (n == 0) {
                state_->input_eof = true;
            }
            strm.next_in = state_->input;
            strm.avail_in = static_cast<uInt>(n);
        }

        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            state_->finished = true;
            break;
        }
        if (ret == Z_BUF_ERROR && state_->input_eof && strm.avail_in == 0) {
            error_ = "compressed stream is truncated";
            return -1;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            error_ = std::string("corrupt compressed stream: ") + (strm.msg ? strm.msg : zError(ret));
            return -1;
        }
    }

    return static_cast<std::ptrdiff_t>(strm.next_out - buf);
}

// ============================================================================
// XzSource (liblzma)
// ============================================================================

struct XzSource::State {
    lzma_stream strm = LZMA_STREAM_INIT;
    bool initialized = false;
    bool finished = false;
    bool input_eof = false;
    uint8_t input[INPUT_CHUNK];
};

XzSource::XzSource(std::unique_ptr<ByteSource> inner)
    : inner_(std::move(inner)), state_(std::make_unique<State>()) {
    lzma_ret ret = lzma_stream_decoder(&state_->strm, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        error_ = "lzma_stream_decoder failed (" + std::to_string(static_cast<int>(ret)) + ")";
        return;
    }
    state_->initialized = true;
}

XzSource::~XzSource() {
    if (state_ && state_->initialized) {
        lzma_end(&state_->strm);
    }
}

std::ptrdiff_t XzSource::read(uint8_t* buf, size_t len) {
    if (!state_->initialized) {
        return -1;
    }
    if (state_->finished || len == 0) {
        return 0;
    }

    lzma_stream& strm = state_->strm;
    strm.next_out = buf;
    strm.avail_out = len;

    while (strm.avail_out > 0) {
        lzma_action action = LZMA_RUN;
        if (strm.avail_in == 0 && !state_->input_eof) {
            std::ptrdiff_t n = inner_->read(state_->input, sizeof(state_->input));
            if (n < 0) {
                error_ = inner_->error();
                return -1;
            }
            if (n == 0) {
                state_->input_eof = true;
            }
            strm.next_in = state_->input;
            strm.avail_in = static_cast<size_t>(n);
        }
        if (state_->input_eof) {
            // LZMA_CONCATENATED needs LZMA_FINISH to report the end of input
            action = LZMA_FINISH;
        }

        lzma_ret ret = lzma_code(&strm, action);
        if (ret == LZMA_STREAM_END) {
            state_->finished = true;
            break;
        }
        if (ret == LZMA_BUF_ERROR && state_->input_eof) {
            error_ = "compressed stream is truncated";
            return -1;
        }
        if (ret != LZMA_OK && ret != LZMA_BUF_ERROR) {
            switch (ret) {
                case LZMA_FORMAT_ERROR: error_ = "not an xz stream"; break;
                case LZMA_DATA_ERROR: error_ = "corrupt xz stream"; break;
                case LZMA_MEM_ERROR: error_ = "out of memory decoding xz stream"; break;
                default:
                    error_ = "xz decoder error (" + std::to_string(static_cast<int>(ret)) + ")";
                    break;
            }
            return -1;
        }
    }

    return static_cast<std::ptrdiff_t>(strm.next_out - buf);
}

// ============================================================================
// Helpers
// ============================================================================

std::unique_ptr<ByteSource> make_decoder(Compression compression,
                                         std::unique_ptr<ByteSource> inner) {
    switch (compression) {
        case Compression::Gzip:
            return std::make_unique<InflateSource>(std::move(inner), true);
        case Compression::RawDeflate:
            return std::make_unique<InflateSource>(std::move(inner), false);
        case Compression::Xz:
            return std::make_unique<XzSource>(std::move(inner));
        case Compression::None:
        default:
            return inner;
    }
}

bool read_exact(ByteSource& source, uint8_t* buf, size_t len, bool* short_read) {
    if (short_read) *short_read = false;
    size_t done = 0;
    while (done < len) {
        std::ptrdiff_t n = source.read(buf + done, len - done);
        if (n < 0) {
            return false;
        }
        if (n == 0) {
            if (short_read) *short_read = true;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

} // namespace upkg
