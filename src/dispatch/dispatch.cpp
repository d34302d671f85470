#include "upkg/dispatch.hpp"
#include "upkg/bundle.hpp"
#include "upkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

namespace upkg {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* package_format_to_string(PackageFormat f) {
    switch (f) {
        case PackageFormat::Eopkg: return "eopkg";
        case PackageFormat::Deb: return "deb";
        case PackageFormat::Rpm: return "rpm";
        case PackageFormat::Apk: return "apk";
        case PackageFormat::Pacman: return "pacman";
        default: return "unknown";
    }
}

const char* backend_to_string(Backend b) {
    switch (b) {
        case Backend::Native: return "native";
        case Backend::Foreign: return "foreign";
        default: return "unsupported";
    }
}

PackageFormat detect_package_format(const std::string& path) {
    if (is_directory(path)) {
        if (is_regular_file(join_path(path, METADATA_DOCUMENT)) &&
            is_regular_file(join_path(path, FILES_DOCUMENT))) {
            return PackageFormat::Eopkg;
        }
        return PackageFormat::Unknown;
    }

    std::string name = path;
    size_t slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ends_with(name, ".eopkg")) return PackageFormat::Eopkg;
    if (ends_with(name, ".deb")) return PackageFormat::Deb;
    if (ends_with(name, ".rpm")) return PackageFormat::Rpm;
    if (ends_with(name, ".apk")) return PackageFormat::Apk;
    if (name.find(".pkg.tar") != std::string::npos) return PackageFormat::Pacman;
    return PackageFormat::Unknown;
}

Backend select_backend(PackageFormat format) {
    switch (format) {
        case PackageFormat::Eopkg:
            return Backend::Native;
        case PackageFormat::Deb:
        case PackageFormat::Rpm:
        case PackageFormat::Apk:
        case PackageFormat::Pacman:
            return Backend::Foreign;
        default:
            return Backend::Unsupported;
    }
}

std::vector<std::string> foreign_install_command(PackageFormat format,
                                                 const std::string& package_path,
                                                 bool force) {
    std::vector<std::string> argv;
    switch (format) {
        case PackageFormat::Deb:
            argv = {"dpkg", "-i"};
            if (force) argv.push_back("--force-all");
            break;
        case PackageFormat::Rpm:
            argv = {"rpm", "-i"};
            if (force) {
                argv.push_back("--force");
                argv.push_back("--nodeps");
            }
            break;
        case PackageFormat::Apk:
            argv = {"apk", "add", "--allow-untrusted"};
            if (force) argv.push_back("--force-overwrite");
            break;
        case PackageFormat::Pacman:
            argv = {"pacman", "-U", "--noconfirm"};
            if (force) {
                argv.push_back("--overwrite");
                argv.push_back("*");
            }
            break;
        default:
            return {};
    }
    argv.push_back(package_path);
    return argv;
}

ExecResult run_command(const std::vector<std::string>& args) {
    ExecResult result;
    if (args.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> argv;
    for (const auto& s : args) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child: stdout/stderr are inherited so tool output reaches the console
        setenv("LANG", "C", 1);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }
    return result;
}

ExecResult run_foreign_installer(PackageFormat format, const std::string& package_path, bool force) {
    auto argv = foreign_install_command(format, package_path, force);
    if (argv.empty()) {
        ExecResult result;
        result.error = std::string("no foreign installer for format ") + package_format_to_string(format);
        return result;
    }
    spdlog::info("delegating {} to {}", package_path, argv[0]);
    auto result = run_command(argv);
    if (result.ok && result.exit_code == 127) {
        spdlog::debug("{} exited with 127 (tool may be missing)", argv[0]);
    }
    return result;
}

} // namespace upkg
