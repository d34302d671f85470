#pragma once

#include <string>
#include <vector>

namespace upkg {

// ============================================================================
// Format Detection
// ============================================================================

enum class PackageFormat {
    Eopkg,
    Deb,
    Rpm,
    Apk,
    Pacman,
    Unknown,
};

const char* package_format_to_string(PackageFormat f);

// By case-insensitive extension; a directory holding metadata.xml and
// files.xml is an unpacked eopkg bundle
PackageFormat detect_package_format(const std::string& path);

enum class Backend {
    Native,       // this engine
    Foreign,      // the distribution's own installer
    Unsupported,
};

const char* backend_to_string(Backend b);

Backend select_backend(PackageFormat format);

// ============================================================================
// Foreign Installers
// ============================================================================

struct ExecResult {
    bool ok = false;     // process ran and was reaped
    int exit_code = -1;  // 128 + signal when killed
    std::string error;
};

// argv for the system tool that installs a foreign package; empty for
// formats without a foreign installer
std::vector<std::string> foreign_install_command(PackageFormat format,
                                                 const std::string& package_path,
                                                 bool force);

// Spawn argv[0] from PATH with inherited stdio and wait for it
ExecResult run_command(const std::vector<std::string>& argv);

ExecResult run_foreign_installer(PackageFormat format, const std::string& package_path, bool force);

} // namespace upkg
