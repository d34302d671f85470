#pragma once

#include "upkg/installer.hpp"
#include "upkg/types.hpp"
#include "upkg/verifier.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Options
// ============================================================================

struct InstallOptions {
    std::string target_root = "/";
    std::string staging_root;  // empty: system temporary directory
    bool force = false;
    VerifyPolicy policy = VerifyPolicy::Strict;
    size_t jobs = 0;           // 0: hardware concurrency
    bool write_record = true;

    std::shared_ptr<CancellationToken> cancel;
    ProgressCallback progress;
};

struct OptionsLoadResult {
    bool ok = false;
    std::string error;
    InstallOptions options;
};

// Overlay JSON config keys (target_root, staging_root, force,
// verification_policy, jobs, write_record) onto base
OptionsLoadResult load_install_options_json(const std::string& json_str,
                                            const InstallOptions& base = {});
OptionsLoadResult load_install_options_file(const std::string& path,
                                            const InstallOptions& base = {});

// ============================================================================
// Resources
// ============================================================================

// Private per-operation scratch directory, removed on destruction
class StagingArea {
public:
    StagingArea() = default;
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    // Create <staging_root>/upkg-staging-<uuid> with mode 0700
    bool create(const std::string& staging_root, std::string& error);

    const std::string& path() const { return path_; }
    std::string content_dir() const;  // extracted archive
    std::string backup_dir() const;   // files replaced under force

private:
    std::string path_;
};

// Exclusive advisory lock serializing operations on one target root
class TargetLock {
public:
    TargetLock() = default;
    ~TargetLock();

    TargetLock(const TargetLock&) = delete;
    TargetLock& operator=(const TargetLock&) = delete;

    // Fails immediately when another operation holds the lock
    bool acquire(const std::string& staging_root, const std::string& target_root, std::string& error);

    bool held() const { return fd_ >= 0; }
    const std::string& lock_path() const { return lock_path_; }

    static std::string lock_path_for(const std::string& staging_root, const std::string& target_root);

private:
    int fd_ = -1;
    std::string lock_path_;
};

// ============================================================================
// Engine
// ============================================================================

enum class InstallStage {
    Loaded,
    ManifestParsed,
    Extracted,
    Verified,
    Planned,
    Installed,
    Failed,
};

const char* install_stage_to_string(InstallStage s);

struct InstallResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    InstallStage stage = InstallStage::Loaded;  // last stage reached
    InstallStage failed_at = InstallStage::Loaded;

    Manifest manifest;
    std::string archive_name;
    std::string archive_sha256;
    VerificationReport report;
    InstallPlan plan;
    std::vector<std::string> installed;
    std::vector<WarningObject> warnings;
    std::string record_path;
};

// Parse, extract, verify, plan and apply a bundle onto options.target_root
InstallResult install_bundle(const std::string& package_path, const InstallOptions& options);

// Parse, extract and verify only. Never touches a target root.
InstallResult verify_bundle(const std::string& package_path, const InstallOptions& options);

} // namespace upkg
