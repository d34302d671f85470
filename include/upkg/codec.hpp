#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace upkg {

// ============================================================================
// Byte Sources
// ============================================================================

// A pull-based byte stream. Sources are chained (file -> decoder -> tar reader)
// so no stage ever holds the whole archive in memory.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to len bytes. Returns the number of bytes read, 0 at end of
    // stream, or -1 on error (see error()).
    virtual std::ptrdiff_t read(uint8_t* buf, size_t len) = 0;

    const std::string& error() const { return error_; }

protected:
    std::string error_;
};

// Reads a byte range of a file. length == npos reads to end of file.
class FileByteSource : public ByteSource {
public:
    static constexpr uint64_t npos = ~0ULL;

    FileByteSource(const std::string& path, uint64_t offset = 0, uint64_t length = npos);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    bool is_open() const { return fd_ >= 0; }

    std::ptrdiff_t read(uint8_t* buf, size_t len) override;

private:
    int fd_ = -1;
    uint64_t remaining_;
};

// Serves bytes from an in-memory buffer
class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string data) : data_(std::move(data)) {}

    std::ptrdiff_t read(uint8_t* buf, size_t len) override;

private:
    std::string data_;
    size_t pos_ = 0;
};

// ============================================================================
// Decoders
// ============================================================================

enum class Compression {
    None,
    Gzip,
    Xz,
    RawDeflate,  // zip member payload
};

const char* compression_to_string(Compression c);

// Compression implied by an archive file name (".tar.xz", ".tgz", ...)
Compression compression_from_name(const std::string& name);

// zlib inflate over an inner source (gzip framing or raw deflate)
class InflateSource : public ByteSource {
public:
    InflateSource(std::unique_ptr<ByteSource> inner, bool gzip_framing);
    ~InflateSource() override;

    InflateSource(const InflateSource&) = delete;
    InflateSource& operator=(const InflateSource&) = delete;

    std::ptrdiff_t read(uint8_t* buf, size_t len) override;

private:
    struct State;
    std::unique_ptr<ByteSource> inner_;
    std::unique_ptr<State> state_;
};

// liblzma .xz decoder over an inner source
class XzSource : public ByteSource {
public:
    explicit XzSource(std::unique_ptr<ByteSource> inner);
    ~XzSource() override;

    XzSource(const XzSource&) = delete;
    XzSource& operator=(const XzSource&) = delete;

    std::ptrdiff_t read(uint8_t* buf, size_t len) override;

private:
    struct State;
    std::unique_ptr<ByteSource> inner_;
    std::unique_ptr<State> state_;
};

// Wrap inner with the decoder for the given compression (None returns inner)
std::unique_ptr<ByteSource> make_decoder(Compression compression,
                                         std::unique_ptr<ByteSource> inner);

// Read exactly len bytes. Returns false on error or premature end of stream;
// short_read is set when the stream ended early.
bool read_exact(ByteSource& source, uint8_t* buf, size_t len, bool* short_read = nullptr);

} // namespace upkg
