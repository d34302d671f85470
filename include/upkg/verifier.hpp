#pragma once

#include "upkg/codec.hpp"
#include "upkg/types.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Digests (OpenSSL EVP)
// ============================================================================

enum class HashAlgorithm {
    Sha1,    // declared content hashes
    Sha256,  // archive provenance
};

struct HashResult {
    bool ok = false;
    std::string hex_digest;  // lowercase
    std::string error;
};

HashResult compute_digest(HashAlgorithm algorithm, const std::vector<uint8_t>& data);
HashResult compute_file_digest(HashAlgorithm algorithm, const std::string& file_path);
HashResult compute_stream_digest(HashAlgorithm algorithm, ByteSource& source);

inline HashResult compute_sha1(const std::vector<uint8_t>& data) {
    return compute_digest(HashAlgorithm::Sha1, data);
}
inline HashResult compute_sha1(const std::string& file_path) {
    return compute_file_digest(HashAlgorithm::Sha1, file_path);
}
inline HashResult compute_sha256(const std::vector<uint8_t>& data) {
    return compute_digest(HashAlgorithm::Sha256, data);
}
inline HashResult compute_sha256(const std::string& file_path) {
    return compute_file_digest(HashAlgorithm::Sha256, file_path);
}

// ============================================================================
// Verification
// ============================================================================

enum class Verdict {
    Match,
    Mismatch,
    Unreadable,
};

inline const char* verdict_to_string(Verdict v) {
    switch (v) {
        case Verdict::Match: return "match";
        case Verdict::Mismatch: return "mismatch";
        case Verdict::Unreadable: return "unreadable";
        default: return "unknown";
    }
}

struct VerificationResult {
    std::string path;
    FileKind kind = FileKind::Regular;
    Verdict verdict = Verdict::Unreadable;
    std::string expected;      // declared digest
    std::string actual;        // computed digest (Match / Mismatch)
    uint64_t actual_size = 0;  // bytes hashed
    std::string cause;         // Unreadable only
};

struct VerificationReport {
    std::vector<VerificationResult> results;  // manifest order
    size_t matched = 0;
    size_t mismatched = 0;
    size_t unreadable = 0;
    bool cancelled = false;

    bool all_match() const { return mismatched == 0 && unreadable == 0 && !cancelled; }

    // First result with the given verdict, in manifest order
    const VerificationResult* first(Verdict verdict) const;
};

// Verify a single entry against its staged counterpart under staging_dir
VerificationResult verify_entry(const FileEntry& entry, const std::string& staging_dir);

// Worker count for a pool over entry_count items.
// requested == 0 means hardware concurrency.
size_t effective_jobs(size_t requested, size_t entry_count);

// Starts one worker; throws std::system_error when no thread is available
using WorkerLauncher = std::function<std::future<size_t>(std::function<size_t()>)>;

// Run work on up to `workers` threads and return the sum of their results.
// work must pull from a shared queue. When a thread cannot be started, the
// calling thread runs work itself. An empty launcher uses std::async.
size_t run_worker_pool(size_t workers, const std::function<size_t()>& work,
                       const WorkerLauncher& launch = {});

// Verify every entry on a bounded worker pool. The report is assembled only
// after all workers have finished.
VerificationReport verify_entries(const std::vector<FileEntry>& entries,
                                  const std::string& staging_dir,
                                  size_t jobs = 0,
                                  const CancellationToken* cancel = nullptr);

} // namespace upkg
