#include "upkg/verifier.hpp"
#include "upkg/path_utils.hpp"
#include "upkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <future>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/evp.h>

namespace upkg {

// ============================================================================
// Digests (OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

const EVP_MD* evp_for(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256 ? EVP_sha256() : EVP_sha1();
}

// Incremental digest shared by the buffer, file and stream variants
class Digest {
public:
    explicit Digest(HashAlgorithm algorithm) {
        if (!ctx_) {
            error_ = "EVP_MD_CTX_new failed";
        } else if (EVP_DigestInit_ex(ctx_.get(), evp_for(algorithm), nullptr) != 1) {
            error_ = "EVP_DigestInit_ex failed";
        }
    }

    bool update(const void* data, size_t len) {
        if (!error_.empty()) return false;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            error_ = "EVP_DigestUpdate failed";
            return false;
        }
        return true;
    }

    HashResult finish() {
        HashResult result;
        if (!error_.empty()) {
            result.error = error_;
            return result;
        }
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
            result.error = "EVP_DigestFinal_ex failed";
            return result;
        }
        result.hex_digest = bytes_to_hex(hash, hash_len);
        result.ok = true;
        return result;
    }

    const std::string& error() const { return error_; }

private:
    EvpMdCtx ctx_;
    std::string error_;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

HashResult compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data) {
    Digest digest(algorithm);
    digest.update(data.data(), data.size());
    return digest.finish();
}

HashResult compute_file_digest(HashAlgorithm algorithm, const std::string& file_path) {
    HashResult result;

    int fd = open(file_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        result.error = "failed to open " + file_path + ": " + std::string(strerror(errno));
        return result;
    }

    Digest digest(algorithm);
    uint8_t buffer[65536];
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            result.error = "failed to read " + file_path + ": " + std::string(strerror(errno));
            close(fd);
            return result;
        }
        if (n == 0) break;
        if (!digest.update(buffer, static_cast<size_t>(n))) break;
    }
    close(fd);

    return digest.finish();
}

HashResult compute_stream_digest(HashAlgorithm algorithm, ByteSource& source) {
    Digest digest(algorithm);
    uint8_t buffer[65536];
    for (;;) {
        std::ptrdiff_t n = source.read(buffer, sizeof(buffer));
        if (n < 0) {
            HashResult result;
            result.error = source.error();
            return result;
        }
        if (n == 0) break;
        if (!digest.update(buffer, static_cast<size_t>(n))) break;
    }
    return digest.finish();
}

// ============================================================================
// Verification
// ============================================================================

const VerificationResult* VerificationReport::first(Verdict verdict) const {
    for (const auto& r : results) {
        if (r.verdict == verdict) {
            return &r;
        }
    }
    return nullptr;
}

VerificationResult verify_entry(const FileEntry& entry, const std::string& staging_dir) {
    VerificationResult result;
    result.path = entry.path;
    result.kind = entry.kind;
    result.expected = to_lower(entry.hash);

    std::string offender;
    if (!parent_chain_is_plain(staging_dir, entry.path, offender)) {
        result.verdict = Verdict::Unreadable;
        result.cause = "staged path passes through symlink '" + offender + "'";
        return result;
    }

    std::string staged = join_path(staging_dir, entry.path);
    struct stat st;
    bool present = lstat(staged.c_str(), &st) == 0;

    if (entry.kind == FileKind::Directory) {
        // Directories are created on install when the archive omits them
        if (!present || S_ISDIR(st.st_mode)) {
            result.verdict = Verdict::Match;
        } else {
            result.verdict = Verdict::Unreadable;
            result.cause = "declared directory is staged as a non-directory";
        }
        return result;
    }

    if (!present) {
        result.verdict = Verdict::Unreadable;
        result.cause = "missing from archive";
        return result;
    }

    HashResult digest;
    if (entry.kind == FileKind::Symlink) {
        if (!S_ISLNK(st.st_mode)) {
            result.verdict = Verdict::Unreadable;
            result.cause = "declared symlink is staged as a different kind";
            return result;
        }
        auto target = read_symlink(staged);
        if (!target) {
            result.verdict = Verdict::Unreadable;
            result.cause = "failed to read symlink target";
            return result;
        }
        digest = compute_sha1(std::vector<uint8_t>(target->begin(), target->end()));
        result.actual_size = target->size();
    } else {
        if (!S_ISREG(st.st_mode)) {
            result.verdict = Verdict::Unreadable;
            result.cause = "declared file is staged as a different kind";
            return result;
        }
        digest = compute_sha1(staged);
        result.actual_size = static_cast<uint64_t>(st.st_size);
    }

    if (!digest.ok) {
        result.verdict = Verdict::Unreadable;
        result.cause = digest.error;
        return result;
    }

    result.actual = digest.hex_digest;
    result.verdict = result.actual == result.expected ? Verdict::Match : Verdict::Mismatch;
    return result;
}

size_t effective_jobs(size_t requested, size_t entry_count) {
    size_t jobs = requested;
    if (jobs == 0) {
        jobs = std::thread::hardware_concurrency();
    }
    jobs = std::max<size_t>(jobs, 1);
    if (entry_count > 0) {
        jobs = std::min(jobs, entry_count);
    }
    return jobs;
}

size_t run_worker_pool(size_t workers, const std::function<size_t()>& work,
                       const WorkerLauncher& launch) {
    std::vector<std::future<size_t>> futures;
    futures.reserve(workers);
    size_t processed = 0;
    try {
        for (size_t w = 0; w < workers; ++w) {
            if (launch) {
                futures.push_back(launch(work));
            } else {
                futures.push_back(std::async(std::launch::async, work));
            }
        }
    } catch (const std::system_error& e) {
        // Whatever the started workers leave is done here
        spdlog::warn("started {} of {} workers: {}", futures.size(), workers, e.what());
        processed += work();
    }

    for (auto& fut : futures) {
        processed += fut.get();
    }
    return processed;
}

VerificationReport verify_entries(const std::vector<FileEntry>& entries,
                                  const std::string& staging_dir,
                                  size_t jobs,
                                  const CancellationToken* cancel) {
    VerificationReport report;
    report.results.resize(entries.size());

    std::atomic<size_t> next{0};
    size_t workers = effective_jobs(jobs, entries.size());

    spdlog::debug("verifying {} entries with {} workers", entries.size(), workers);

    // Each worker claims the next unverified index; each slot is written by
    // exactly one worker, so results need no lock.
    auto worker = [&]() {
        size_t processed = 0;
        for (;;) {
            if (is_cancelled(cancel)) break;
            size_t i = next.fetch_add(1);
            if (i >= entries.size()) break;
            report.results[i] = verify_entry(entries[i], staging_dir);
            ++processed;
        }
        return processed;
    };

    size_t processed = run_worker_pool(workers, worker);

    if (processed < entries.size()) {
        report.cancelled = true;
        report.results.clear();
        return report;
    }

    for (const auto& r : report.results) {
        switch (r.verdict) {
            case Verdict::Match: ++report.matched; break;
            case Verdict::Mismatch: ++report.mismatched; break;
            case Verdict::Unreadable: ++report.unreadable; break;
        }
    }

    spdlog::info("verified {} entries: {} match, {} mismatch, {} unreadable",
                 entries.size(), report.matched, report.mismatched, report.unreadable);
    return report;
}

} // namespace upkg
