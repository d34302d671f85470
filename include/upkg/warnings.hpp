#pragma once

#include "upkg/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace upkg {

// ============================================================================
// Warning Keys
// ============================================================================

enum class Warning {
    integrity_mismatch,     // Permissive policy: entry skipped
    size_mismatch,          // Declared size differs, hash matched
    undeclared_member,      // Archive member not listed in the file list
    ownership_not_applied,
    mode_not_applied,
    rollback_incomplete,
};

inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::integrity_mismatch: return "integrity_mismatch";
        case Warning::size_mismatch: return "size_mismatch";
        case Warning::undeclared_member: return "undeclared_member";
        case Warning::ownership_not_applied: return "ownership_not_applied";
        case Warning::mode_not_applied: return "mode_not_applied";
        case Warning::rollback_incomplete: return "rollback_incomplete";
        default: return "unknown";
    }
}

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with a single path field (convenience)
    void emit_for_path(Warning warning, const std::string& path, const std::string& detail = "");

    // All emitted warnings, in emission order
    const std::vector<WarningObject>& get_warnings() const { return warnings_; }

    // Number of warnings emitted under a key
    size_t count(Warning warning) const;

    bool empty() const { return warnings_.empty(); }

    void clear() { warnings_.clear(); }

private:
    std::vector<WarningObject> warnings_;
};

// Render a warning as a single human-readable line
std::string format_warning(const WarningObject& warning);

// ============================================================================
// Convenience functions for building warning fields
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> integrity_mismatch(
    const std::string& path,
    const std::string& expected,
    const std::string& actual) {
    return {{"path", path}, {"expected", expected}, {"actual", actual}};
}

inline std::unordered_map<std::string, std::string> size_mismatch(
    const std::string& path,
    uint64_t declared,
    uint64_t actual) {
    return {{"path", path},
            {"declared", std::to_string(declared)},
            {"actual", std::to_string(actual)}};
}

} // namespace warnings

} // namespace upkg
