#include "upkg/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace upkg {

namespace fs = std::filesystem;

namespace {

bool fsync_fd(int fd) {
    return fsync(fd) == 0;
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Generate a temporary filename next to base
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    fs::path p(base);
    return (p.parent_path() / ("." + p.filename().string() + ".upkg-tmp." + suffix)).string();
}

bool write_all(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = "failed to write content: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst) {
    AtomicWriteResult result;

    // O_NONBLOCK keeps a FIFO source from stalling the open
    int in_fd = open(src.c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
    if (in_fd < 0) {
        result.error = "failed to open " + src + ": " + std::string(strerror(errno));
        return result;
    }

    struct stat st;
    if (fstat(in_fd, &st) != 0) {
        result.error = "failed to stat " + src + ": " + std::string(strerror(errno));
        close(in_fd);
        return result;
    }
    if (!S_ISREG(st.st_mode)) {
        result.error = "not a regular file: " + src;
        close(in_fd);
        return result;
    }

    std::string temp_path = make_temp_filename(dst);
    int out_fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (out_fd < 0) {
        result.error = "failed to create " + temp_path + ": " + std::string(strerror(errno));
        close(in_fd);
        return result;
    }

    uint8_t buffer[65536];
    for (;;) {
        ssize_t n = read(in_fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = "failed to read " + src + ": " + std::string(strerror(errno));
            break;
        }
        if (n == 0) break;
        if (!write_all(out_fd, buffer, static_cast<size_t>(n))) {
            result.error = "failed to write " + dst + ": " + std::string(strerror(errno));
            break;
        }
    }
    close(in_fd);

    if (result.error.empty() && !fsync_fd(out_fd)) {
        result.error = "failed to fsync " + dst + ": " + std::string(strerror(errno));
    }
    close(out_fd);

    if (!result.error.empty()) {
        unlink(temp_path.c_str());
        return result;
    }

    if (rename(temp_path.c_str(), dst.c_str()) != 0) {
        result.error = "failed to rename into " + dst + ": " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    std::string parent = get_parent_directory(dst);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target) {
    AtomicWriteResult result;

    // Create symlink with temp name, then rename
    std::string temp_path = make_temp_filename(link_path);

    if (symlink(target.c_str(), temp_path.c_str()) != 0) {
        result.error = "failed to create symlink: " + std::string(strerror(errno));
        return result;
    }

    if (rename(temp_path.c_str(), link_path.c_str()) != 0) {
        result.error = "failed to rename symlink: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    std::string parent = get_parent_directory(link_path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

std::optional<std::string> read_symlink(const std::string& path) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return target.string();
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return false;
    }
    return fs::is_directory(path, ec);
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace upkg
