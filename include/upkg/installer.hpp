#pragma once

#include "upkg/types.hpp"
#include "upkg/verifier.hpp"
#include "upkg/warnings.hpp"

#include <functional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace upkg {

// ============================================================================
// Install Plan
// ============================================================================

enum class PlanAction {
    Create,
    Conflict,
    Skip,
};

inline const char* plan_action_to_string(PlanAction a) {
    switch (a) {
        case PlanAction::Create: return "create";
        case PlanAction::Conflict: return "conflict";
        case PlanAction::Skip: return "skip";
        default: return "unknown";
    }
}

struct PlannedAction {
    FileEntry entry;
    std::string target_path;         // absolute path under the target root
    PlanAction action = PlanAction::Create;
    bool replaces_existing = false;  // Create over an existing path (force)
    std::string reason;              // Conflict / Skip explanation
};

struct InstallPlan {
    std::vector<PlannedAction> actions;  // manifest order
    size_t create_count = 0;
    size_t conflict_count = 0;
    size_t skip_count = 0;

    bool has_conflicts() const { return conflict_count > 0; }
    const PlannedAction* first_conflict() const;
};

// Decide an action for every entry against the current state of target_root.
// Entries whose verification result is not Match are never planned as Create.
InstallPlan build_install_plan(const std::vector<FileEntry>& entries,
                               const std::string& target_root,
                               const VerificationReport& report,
                               bool force);

// ============================================================================
// Journal
// ============================================================================

enum class JournalOp {
    CreatedDirectory,
    CreatedFile,
    CreatedSymlink,
    Replaced,
};

struct JournalEntry {
    JournalOp op = JournalOp::CreatedFile;
    std::string target;

    // Replaced only: the prior content, preserved for restore
    bool backup_is_symlink = false;
    std::string backup;  // staged copy path, or symlink target
    mode_t original_mode = 0;
    uid_t original_uid = 0;
    gid_t original_gid = 0;
};

class InstallJournal {
public:
    void record(JournalEntry entry) { entries_.push_back(std::move(entry)); }

    const std::vector<JournalEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Undo every recorded mutation in reverse order. Steps that cannot be
    // undone are reported as rollback_incomplete warnings. Returns true when
    // everything was undone.
    bool rollback(WarningCollector& warnings);

private:
    std::vector<JournalEntry> entries_;
};

// ============================================================================
// Application
// ============================================================================

using ProgressCallback = std::function<void(const PlannedAction& action, size_t done, size_t total)>;

struct ApplyOptions {
    std::string backup_dir;  // where replaced files are preserved
    const CancellationToken* cancel = nullptr;
    ProgressCallback progress;
};

struct ApplyResult {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<std::string> installed;  // relative paths, application order
    bool rolled_back = false;

    // On success, the mutations made; callers may still roll them back
    InstallJournal journal;
};

// Apply a conflict-free plan: directories first, then files and symlinks,
// each group in manifest order. On failure or cancellation the journal is
// rolled back before returning.
ApplyResult apply_install_plan(const InstallPlan& plan,
                               const std::string& target_root,
                               const std::string& staging_dir,
                               WarningCollector& warnings,
                               const ApplyOptions& options = {});

} // namespace upkg
