#include "upkg/engine.hpp"
#include "upkg/archive.hpp"
#include "upkg/bundle.hpp"
#include "upkg/install_record.hpp"
#include "upkg/platform.hpp"
#include "upkg/warnings.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unordered_set>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace upkg {

const char* install_stage_to_string(InstallStage s) {
    switch (s) {
        case InstallStage::Loaded: return "loaded";
        case InstallStage::ManifestParsed: return "manifest_parsed";
        case InstallStage::Extracted: return "extracted";
        case InstallStage::Verified: return "verified";
        case InstallStage::Planned: return "planned";
        case InstallStage::Installed: return "installed";
        case InstallStage::Failed: return "failed";
        default: return "unknown";
    }
}

// ============================================================================
// StagingArea
// ============================================================================

StagingArea::~StagingArea() {
    if (!path_.empty() && !remove_directory(path_)) {
        spdlog::warn("failed to remove staging area {}", path_);
    }
}

bool StagingArea::create(const std::string& staging_root, std::string& error) {
    if (!create_directories(staging_root)) {
        error = "failed to create staging root: " + staging_root;
        return false;
    }
    std::string path = join_path(staging_root, "upkg-staging-" + generate_uuid());
    if (mkdir(path.c_str(), 0700) != 0) {
        error = "failed to create staging area " + path + ": " + std::string(strerror(errno));
        return false;
    }
    path_ = path;
    spdlog::debug("staging area {}", path_);
    return true;
}

std::string StagingArea::content_dir() const {
    return join_path(path_, "root");
}

std::string StagingArea::backup_dir() const {
    return join_path(path_, "backup");
}

// ============================================================================
// TargetLock
// ============================================================================

TargetLock::~TargetLock() {
    if (fd_ >= 0) {
        if (flock(fd_, LOCK_UN) != 0) {
            spdlog::warn("failed to release lock {}: {}", lock_path_, strerror(errno));
        }
        close(fd_);
    }
}

std::string TargetLock::lock_path_for(const std::string& staging_root, const std::string& target_root) {
    auto digest = compute_sha256(std::vector<uint8_t>(target_root.begin(), target_root.end()));
    std::string tag = digest.ok ? digest.hex_digest.substr(0, 16) : "default";
    return join_path(staging_root, "upkg-" + tag + ".lock");
}

bool TargetLock::acquire(const std::string& staging_root, const std::string& target_root,
                         std::string& error) {
    if (!create_directories(staging_root)) {
        error = "failed to create staging root: " + staging_root;
        return false;
    }

    lock_path_ = lock_path_for(staging_root, target_root);
    int fd = open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "failed to open lock file " + lock_path_ + ": " + std::string(strerror(errno));
        return false;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            error = "target root is locked by another operation: " + target_root;
        } else {
            error = "failed to lock " + lock_path_ + ": " + std::string(strerror(errno));
        }
        close(fd);
        return false;
    }

    fd_ = fd;
    return true;
}

// ============================================================================
// Pipeline
// ============================================================================

namespace {

class Pipeline {
public:
    Pipeline(const std::string& package_path, const InstallOptions& options)
        : package_path_(package_path), options_(options) {}

    InstallResult run(bool install);

private:
    InstallResult& fail(ErrorKind kind, const std::string& error) {
        result_.ok = false;
        result_.error_kind = kind;
        result_.error = error;
        result_.failed_at = result_.stage;
        result_.stage = InstallStage::Failed;
        result_.warnings = warnings_.get_warnings();
        spdlog::debug("stage {} -> failed: {}", install_stage_to_string(result_.failed_at), error);
        return result_;
    }

    void advance(InstallStage stage) {
        spdlog::debug("stage {} -> {}", install_stage_to_string(result_.stage),
                      install_stage_to_string(stage));
        result_.stage = stage;
    }

    bool cancelled() const { return is_cancelled(options_.cancel.get()); }

    bool check_verification();
    void report_undeclared(const std::vector<ExtractedMember>& members);
    bool write_record(InstallJournal& journal);

    std::string package_path_;
    const InstallOptions& options_;
    InstallResult result_;
    WarningCollector warnings_;
    PackageBundle bundle_;
    std::string target_root_;
};

bool Pipeline::check_verification() {
    const VerificationReport& report = result_.report;

    if (const auto* unreadable = report.first(Verdict::Unreadable)) {
        fail(ErrorKind::IntegrityError,
             "cannot verify " + unreadable->path + ": " + unreadable->cause);
        return false;
    }

    if (report.mismatched > 0) {
        if (options_.policy == VerifyPolicy::Strict) {
            const auto* m = report.first(Verdict::Mismatch);
            std::string error = "integrity mismatch for " + m->path + ": expected " +
                                m->expected + ", got " + m->actual;
            if (report.mismatched > 1) {
                error += " (" + std::to_string(report.mismatched) + " entries mismatched)";
            }
            fail(ErrorKind::IntegrityError, error);
            return false;
        }
        for (const auto& r : report.results) {
            if (r.verdict == Verdict::Mismatch) {
                warnings_.emit(Warning::integrity_mismatch,
                               warnings::integrity_mismatch(r.path, r.expected, r.actual));
            }
        }
    }

    const auto& files = bundle_.manifest.files;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& r = report.results[i];
        if (r.verdict == Verdict::Match && files[i].kind == FileKind::Regular &&
            r.actual_size != files[i].size) {
            warnings_.emit(Warning::size_mismatch,
                           warnings::size_mismatch(files[i].path, files[i].size, r.actual_size));
        }
    }
    return true;
}

void Pipeline::report_undeclared(const std::vector<ExtractedMember>& members) {
    std::unordered_set<std::string> declared;
    for (const auto& entry : bundle_.manifest.files) {
        declared.insert(entry.path);
    }
    for (const auto& member : members) {
        if (member.type != MemberType::Directory && !declared.count(member.path)) {
            warnings_.emit_for_path(Warning::undeclared_member, member.path);
        }
    }
}

bool Pipeline::write_record(InstallJournal& journal) {
    InstallRecord record = make_install_record(bundle_.manifest, result_.installed);
    record.provenance.source = package_path_;
    record.provenance.archive = bundle_.archive.name;
    record.provenance.archive_sha256 = result_.archive_sha256;
    record.provenance.verification_policy = verify_policy_to_string(options_.policy);
    record.warnings = warnings_.get_warnings();

    auto written = write_install_record(target_root_, record);
    if (!written.ok) {
        if (written.created_directory && !remove_directory(written.created_root)) {
            warnings_.emit_for_path(Warning::rollback_incomplete, written.created_root);
        }
        journal.rollback(warnings_);
        result_.installed.clear();
        fail(ErrorKind::IOError, written.error);
        return false;
    }

    result_.record_path = written.path;
    spdlog::debug("wrote install record {}", written.path);
    return true;
}

InstallResult Pipeline::run(bool install) {
    std::string staging_root = options_.staging_root;
    if (staging_root.empty()) {
        std::error_code ec;
        staging_root = fs::temp_directory_path(ec).string();
        if (ec || staging_root.empty()) {
            staging_root = "/tmp";
        }
    }

    // Loaded: resolve the target and serialize on it
    TargetLock lock;
    if (install) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(options_.target_root, ec);
        if (ec || !is_directory(canonical.string())) {
            return fail(ErrorKind::IOError, "target root is not a directory: " + options_.target_root);
        }
        target_root_ = canonical.string();

        std::string error;
        if (!lock.acquire(staging_root, target_root_, error)) {
            return fail(ErrorKind::IOError, error);
        }
        spdlog::debug("locked target root {} ({})", target_root_, lock.lock_path());
    }

    auto opened = open_bundle(package_path_);
    if (!opened.ok) {
        return fail(opened.error_kind, opened.error);
    }
    bundle_ = std::move(opened.bundle);
    result_.manifest = bundle_.manifest;
    result_.archive_name = bundle_.archive.name;
    advance(InstallStage::ManifestParsed);
    spdlog::info("package {} {} ({} entries)", bundle_.manifest.name,
                 bundle_.manifest.version.value_or("?"), bundle_.manifest.files.size());

    if (cancelled()) {
        return fail(ErrorKind::Cancelled, "operation cancelled");
    }

    if (install && options_.write_record) {
        std::string error;
        auto raw = bundle_.archive.open_raw(error);
        if (!raw) {
            return fail(ErrorKind::ArchiveError, error);
        }
        auto digest = compute_stream_digest(HashAlgorithm::Sha256, *raw);
        if (!digest.ok) {
            return fail(ErrorKind::ArchiveError, "failed to read content archive: " + digest.error);
        }
        result_.archive_sha256 = digest.hex_digest;
    }

    // Extracted
    StagingArea staging;
    {
        std::string error;
        if (!staging.create(staging_root, error)) {
            return fail(ErrorKind::IOError, error);
        }
        auto source = bundle_.archive.open(error);
        if (!source) {
            return fail(ErrorKind::ArchiveError, error);
        }
        auto extracted = extract_archive_safe(*source, staging.content_dir(), options_.cancel.get());
        if (!extracted.ok) {
            return fail(extracted.cancelled ? ErrorKind::Cancelled : ErrorKind::ArchiveError,
                        extracted.error);
        }
        report_undeclared(extracted.members);
        spdlog::info("extracted {} members from {}", extracted.members.size(), bundle_.archive.name);
    }
    advance(InstallStage::Extracted);

    // Verified
    result_.report = verify_entries(bundle_.manifest.files, staging.content_dir(), options_.jobs,
                                    options_.cancel.get());
    if (result_.report.cancelled) {
        return fail(ErrorKind::Cancelled, "operation cancelled during verification");
    }
    if (!check_verification()) {
        return result_;
    }
    advance(InstallStage::Verified);

    if (!install) {
        result_.ok = true;
        result_.warnings = warnings_.get_warnings();
        return result_;
    }

    if (cancelled()) {
        return fail(ErrorKind::Cancelled, "operation cancelled");
    }

    // Planned
    result_.plan = build_install_plan(bundle_.manifest.files, target_root_, result_.report,
                                      options_.force);
    if (const auto* conflict = result_.plan.first_conflict()) {
        std::string error = "conflict at " + conflict->target_path + ": " + conflict->reason;
        if (result_.plan.conflict_count > 1) {
            error += " (" + std::to_string(result_.plan.conflict_count) + " conflicting paths)";
        }
        return fail(ErrorKind::ConflictError, error);
    }
    advance(InstallStage::Planned);

    // Installed
    ApplyOptions apply;
    apply.backup_dir = staging.backup_dir();
    apply.cancel = options_.cancel.get();
    apply.progress = options_.progress;

    auto applied = apply_install_plan(result_.plan, target_root_, staging.content_dir(),
                                      warnings_, apply);
    if (!applied.ok) {
        return fail(applied.error_kind, applied.error);
    }
    result_.installed = applied.installed;

    if (options_.write_record && !write_record(applied.journal)) {
        return result_;
    }

    advance(InstallStage::Installed);
    spdlog::info("installed {} into {} ({} entries, {} skipped, {} warnings)",
                 bundle_.manifest.name, target_root_, result_.installed.size(),
                 result_.plan.skip_count, warnings_.get_warnings().size());

    result_.ok = true;
    result_.warnings = warnings_.get_warnings();
    return result_;
}

} // namespace

InstallResult install_bundle(const std::string& package_path, const InstallOptions& options) {
    return Pipeline(package_path, options).run(true);
}

InstallResult verify_bundle(const std::string& package_path, const InstallOptions& options) {
    return Pipeline(package_path, options).run(false);
}

} // namespace upkg
