#include "upkg/installer.hpp"
#include "upkg/manifest.hpp"
#include "upkg/path_utils.hpp"
#include "upkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <unordered_set>

#include <sys/stat.h>
#include <unistd.h>

namespace upkg {

namespace {

const char* existing_kind(const struct stat& st) {
    if (S_ISDIR(st.st_mode)) return "directory";
    if (S_ISLNK(st.st_mode)) return "symlink";
    if (S_ISREG(st.st_mode)) return "file";
    return "special file";
}

std::string errno_string() {
    return std::string(strerror(errno));
}

// First existing ancestor of rel (inside root) that is not a directory.
// Symlinks that resolve to directories are accepted.
std::string blocking_parent(const std::string& root, const std::string& rel) {
    std::string current = root;
    size_t start = 0;
    for (;;) {
        size_t slash = rel.find('/', start);
        if (slash == std::string::npos) {
            return {};
        }
        current = join_path(current, rel.substr(start, slash - start));
        struct stat lst;
        if (lstat(current.c_str(), &lst) != 0) {
            return {};  // absent from here on; created on install
        }
        struct stat st;
        if (stat(current.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            return rel.substr(0, slash);
        }
        start = slash + 1;
    }
}

} // namespace

// ============================================================================
// Planning
// ============================================================================

const PlannedAction* InstallPlan::first_conflict() const {
    for (const auto& a : actions) {
        if (a.action == PlanAction::Conflict) {
            return &a;
        }
    }
    return nullptr;
}

InstallPlan build_install_plan(const std::vector<FileEntry>& entries,
                               const std::string& target_root,
                               const VerificationReport& report,
                               bool force) {
    InstallPlan plan;
    bool have_results = report.results.size() == entries.size();

    for (size_t i = 0; i < entries.size(); ++i) {
        const FileEntry& entry = entries[i];
        PlannedAction planned;
        planned.entry = entry;

        auto resolved = normalize_under_root(target_root, entry.path);
        planned.target_path = resolved.ok ? resolved.path : join_path(target_root, entry.path);

        auto decide = [&]() {
            if (!resolved.ok) {
                planned.action = PlanAction::Conflict;
                planned.reason = std::string("path cannot be placed under target root: ") +
                                 path_error_to_string(resolved.error);
                return;
            }

            if (!have_results || report.results[i].verdict != Verdict::Match) {
                planned.action = PlanAction::Skip;
                planned.reason = have_results && report.results[i].verdict == Verdict::Mismatch
                                     ? "integrity mismatch"
                                     : "not verified";
                return;
            }

            std::string parent = blocking_parent(target_root, entry.path);
            if (!parent.empty()) {
                planned.action = PlanAction::Conflict;
                planned.reason = "parent '" + parent + "' exists and is not a directory";
                return;
            }

            struct stat lst;
            if (lstat(planned.target_path.c_str(), &lst) != 0) {
                planned.action = PlanAction::Create;
                return;
            }

            if (entry.kind == FileKind::Directory) {
                struct stat st;
                if (stat(planned.target_path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                    planned.action = PlanAction::Skip;
                    planned.reason = "directory already exists";
                    return;
                }
                planned.action = PlanAction::Conflict;
                planned.reason = std::string("existing ") + existing_kind(lst) +
                                 " where a directory is declared";
                return;
            }

            if (S_ISDIR(lst.st_mode)) {
                planned.action = PlanAction::Conflict;
                planned.reason = "existing directory where a " +
                                 std::string(file_kind_to_string(entry.kind)) + " is declared";
                return;
            }

            // FIFOs, sockets and devices are never replaced
            if (!S_ISREG(lst.st_mode) && !S_ISLNK(lst.st_mode)) {
                planned.action = PlanAction::Conflict;
                planned.reason = "existing special file";
                return;
            }

            if (!force) {
                planned.action = PlanAction::Conflict;
                planned.reason = std::string("existing ") + existing_kind(lst);
                return;
            }

            planned.action = PlanAction::Create;
            planned.replaces_existing = true;
        };
        decide();

        switch (planned.action) {
            case PlanAction::Create: ++plan.create_count; break;
            case PlanAction::Conflict: ++plan.conflict_count; break;
            case PlanAction::Skip: ++plan.skip_count; break;
        }
        spdlog::debug("plan {} {}{}", plan_action_to_string(planned.action), entry.path,
                      planned.reason.empty() ? "" : " (" + planned.reason + ")");
        plan.actions.push_back(std::move(planned));
    }

    spdlog::info("install plan: {} create, {} skip, {} conflict",
                 plan.create_count, plan.skip_count, plan.conflict_count);
    return plan;
}

// ============================================================================
// Journal
// ============================================================================

bool InstallJournal::rollback(WarningCollector& warnings) {
    bool complete = true;

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        const JournalEntry& e = *it;
        switch (e.op) {
            case JournalOp::CreatedFile:
            case JournalOp::CreatedSymlink:
                if (unlink(e.target.c_str()) != 0 && errno != ENOENT) {
                    warnings.emit_for_path(Warning::rollback_incomplete, e.target, errno_string());
                    complete = false;
                }
                break;

            case JournalOp::CreatedDirectory:
                if (rmdir(e.target.c_str()) != 0 && errno != ENOENT) {
                    warnings.emit_for_path(Warning::rollback_incomplete, e.target, errno_string());
                    complete = false;
                }
                break;

            case JournalOp::Replaced: {
                AtomicWriteResult restored = e.backup_is_symlink
                    ? atomic_update_symlink(e.target, e.backup)
                    : atomic_copy_file(e.backup, e.target);
                if (!restored.ok) {
                    warnings.emit_for_path(Warning::rollback_incomplete, e.target, restored.error);
                    complete = false;
                    break;
                }
                if (lchown(e.target.c_str(), e.original_uid, e.original_gid) != 0) {
                    spdlog::debug("rollback: ownership of {} not restored: {}", e.target, errno_string());
                }
                if (!e.backup_is_symlink && chmod(e.target.c_str(), e.original_mode & 07777) != 0) {
                    warnings.emit_for_path(Warning::rollback_incomplete, e.target, errno_string());
                    complete = false;
                }
                break;
            }
        }
    }

    spdlog::info("rolled back {} change(s){}", entries_.size(), complete ? "" : " (incomplete)");
    entries_.clear();
    return complete;
}

// ============================================================================
// Application
// ============================================================================

namespace {

class Applier {
public:
    Applier(const std::string& target_root,
            const std::string& staging_dir,
            WarningCollector& warnings,
            const ApplyOptions& options)
        : target_root_(target_root), staging_dir_(staging_dir),
          warnings_(warnings), options_(options) {}

    InstallJournal& journal() { return journal_; }
    const std::string& error() const { return error_; }

    bool apply(const PlannedAction& action) {
        if (!ensure_parents(action.entry.path)) {
            return false;
        }
        switch (action.entry.kind) {
            case FileKind::Directory: return apply_directory(action);
            case FileKind::Symlink: return apply_symlink(action);
            case FileKind::Regular:
            default:
                return apply_file(action);
        }
    }

private:
    // Create missing ancestors of rel; existing ones are left untouched
    bool ensure_parents(const std::string& rel) {
        std::string current = target_root_;
        size_t start = 0;
        for (;;) {
            size_t slash = rel.find('/', start);
            if (slash == std::string::npos) {
                return true;
            }
            current = join_path(current, rel.substr(start, slash - start));
            if (created_symlinks_.count(current)) {
                error_ = "refusing to write through symlink " + current +
                         " installed by this operation";
                return false;
            }
            if (!make_directory(current)) {
                return false;
            }
            start = slash + 1;
        }
    }

    // Create-if-absent; "already exists" is not an error
    bool make_directory(const std::string& path) {
        if (mkdir(path.c_str(), 0755) == 0) {
            journal_.record({JournalOp::CreatedDirectory, path});
            return true;
        }
        if (errno == EEXIST && is_directory(path)) {
            return true;
        }
        error_ = "failed to create directory " + path + ": " + errno_string();
        return false;
    }

    bool preserve_existing(const PlannedAction& action) {
        struct stat st;
        if (lstat(action.target_path.c_str(), &st) != 0) {
            return true;  // vanished since planning
        }

        JournalEntry e;
        e.op = JournalOp::Replaced;
        e.target = action.target_path;
        e.original_mode = st.st_mode;
        e.original_uid = st.st_uid;
        e.original_gid = st.st_gid;

        if (S_ISLNK(st.st_mode)) {
            auto link = read_symlink(action.target_path);
            if (!link) {
                error_ = "failed to read existing symlink " + action.target_path;
                return false;
            }
            e.backup_is_symlink = true;
            e.backup = *link;
        } else {
            if (options_.backup_dir.empty() || !create_directories(options_.backup_dir)) {
                error_ = "no backup area for replacing " + action.target_path;
                return false;
            }
            e.backup = join_path(options_.backup_dir, std::to_string(backup_counter_++));
            auto copied = atomic_copy_file(action.target_path, e.backup);
            if (!copied.ok) {
                error_ = "failed to preserve " + action.target_path + ": " + copied.error;
                return false;
            }
        }

        journal_.record(std::move(e));
        return true;
    }

    bool apply_directory(const PlannedAction& action) {
        if (!make_directory(action.target_path)) {
            return false;
        }
        apply_metadata(action, true);
        return true;
    }

    bool apply_file(const PlannedAction& action) {
        std::string staged = join_path(staging_dir_, action.entry.path);
        if (action.replaces_existing && !preserve_existing(action)) {
            return false;
        }
        auto copied = atomic_copy_file(staged, action.target_path);
        if (!copied.ok) {
            error_ = "failed to install " + action.entry.path + ": " + copied.error;
            return false;
        }
        if (!action.replaces_existing) {
            journal_.record({JournalOp::CreatedFile, action.target_path});
        }
        apply_metadata(action, true);
        return true;
    }

    bool apply_symlink(const PlannedAction& action) {
        std::string staged = join_path(staging_dir_, action.entry.path);
        auto link = read_symlink(staged);
        if (!link) {
            error_ = "failed to read staged symlink " + action.entry.path;
            return false;
        }
        if (action.replaces_existing && !preserve_existing(action)) {
            return false;
        }
        auto created = atomic_update_symlink(action.target_path, *link);
        if (!created.ok) {
            error_ = "failed to install " + action.entry.path + ": " + created.error;
            return false;
        }
        created_symlinks_.insert(join_path(target_root_, action.entry.path));
        if (!action.replaces_existing) {
            journal_.record({JournalOp::CreatedSymlink, action.target_path});
        }
        apply_metadata(action, false);
        return true;
    }

    // Ownership before mode: chown clears setuid/setgid bits
    void apply_metadata(const PlannedAction& action, bool set_mode) {
        const FileEntry& entry = action.entry;
        struct stat st;
        bool known = lstat(action.target_path.c_str(), &st) == 0;

        if (!known || st.st_uid != entry.uid || st.st_gid != entry.gid) {
            if (lchown(action.target_path.c_str(), entry.uid, entry.gid) != 0) {
                warnings_.emit(Warning::ownership_not_applied,
                               {{"path", entry.path},
                                {"uid", std::to_string(entry.uid)},
                                {"gid", std::to_string(entry.gid)},
                                {"detail", errno_string()}});
            }
        }

        if (set_mode && chmod(action.target_path.c_str(), entry.mode) != 0) {
            warnings_.emit(Warning::mode_not_applied,
                           {{"path", entry.path},
                            {"mode", format_mode(entry.mode)},
                            {"detail", errno_string()}});
        }
    }

    std::string target_root_;
    std::string staging_dir_;
    WarningCollector& warnings_;
    const ApplyOptions& options_;
    InstallJournal journal_;
    std::string error_;
    size_t backup_counter_ = 0;
    std::unordered_set<std::string> created_symlinks_;
};

} // namespace

ApplyResult apply_install_plan(const InstallPlan& plan,
                               const std::string& target_root,
                               const std::string& staging_dir,
                               WarningCollector& warnings,
                               const ApplyOptions& options) {
    ApplyResult result;

    if (plan.has_conflicts()) {
        result.error_kind = ErrorKind::ConflictError;
        result.error = "plan has unresolved conflicts";
        return result;
    }

    std::vector<const PlannedAction*> order;
    for (const auto& a : plan.actions) {
        if (a.action == PlanAction::Create && a.entry.kind == FileKind::Directory) {
            order.push_back(&a);
        }
    }
    for (const auto& a : plan.actions) {
        if (a.action == PlanAction::Create && a.entry.kind != FileKind::Directory) {
            order.push_back(&a);
        }
    }

    Applier applier(target_root, staging_dir, warnings, options);

    auto fail = [&](ErrorKind kind, const std::string& error) {
        result.error_kind = kind;
        result.error = error;
        result.installed.clear();
        applier.journal().rollback(warnings);
        result.rolled_back = true;
        return result;
    };

    for (size_t i = 0; i < order.size(); ++i) {
        const PlannedAction& action = *order[i];

        if (is_cancelled(options.cancel)) {
            return fail(ErrorKind::Cancelled, "operation cancelled during installation");
        }

        if (!applier.apply(action)) {
            spdlog::debug("apply failed at {}: {}", action.entry.path, applier.error());
            return fail(ErrorKind::IOError, applier.error());
        }

        spdlog::debug("installed {}", action.entry.path);
        result.installed.push_back(action.entry.path);

        if (options.progress) {
            options.progress(action, i + 1, order.size());
        }
    }

    if (is_cancelled(options.cancel)) {
        return fail(ErrorKind::Cancelled, "operation cancelled during installation");
    }

    result.journal = std::move(applier.journal());
    result.ok = true;
    return result;
}

} // namespace upkg
