/**
 * upkg CLI - Common utilities and types
 */

#pragma once

#include <upkg/engine.hpp>
#include <upkg/types.hpp>
#include <upkg/warnings.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

namespace upkg::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Process exit codes.
 */
enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_PARSE = 2,
    EXIT_ARCHIVE = 3,
    EXIT_INTEGRITY = 4,
    EXIT_CONFLICT = 5,
    EXIT_IO = 6,
    EXIT_CANCELLED = 7,
    EXIT_UNSUPPORTED = 8,
};

inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return EXIT_OK;
        case ErrorKind::ParseError: return EXIT_PARSE;
        case ErrorKind::ArchiveError: return EXIT_ARCHIVE;
        case ErrorKind::IntegrityError: return EXIT_INTEGRITY;
        case ErrorKind::ConflictError: return EXIT_CONFLICT;
        case ErrorKind::IOError: return EXIT_IO;
        case ErrorKind::Cancelled: return EXIT_CANCELLED;
        default: return EXIT_USAGE;
    }
}

/**
 * Logging goes to stderr; -v shows stage transitions, -q only errors.
 */
inline void configure_logging(const GlobalOptions& opts) {
    // stdout is reserved for command output (and --json documents)
    if (!spdlog::get("upkg")) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("upkg"));
    }
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
    // Warnings reach the console through the log at warn level; JSON output
    // carries them in the result object instead
    if (opts.json) {
        spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::err);
    }
}

/**
 * Output utilities.
 */
inline nlohmann::json warnings_to_json(const std::vector<WarningObject>& warnings) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : warnings) {
        nlohmann::json obj;
        obj["key"] = w.key;
        for (const auto& [k, v] : w.fields) {
            obj[k] = v;
        }
        arr.push_back(obj);
    }
    return arr;
}

inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& kind = "",
                        const std::vector<WarningObject>& warnings = {}) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!kind.empty()) {
            j["error_kind"] = kind;
        }
        if (!warnings.empty()) {
            j["warnings"] = warnings_to_json(warnings);
        }
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

/**
 * Build engine options from --config (if any). Command-line flags are
 * applied on top by each command.
 */
inline bool load_base_options(const GlobalOptions& opts, InstallOptions& out) {
    if (opts.config.empty()) {
        return true;
    }
    auto loaded = load_install_options_file(opts.config, out);
    if (!loaded.ok) {
        print_error("config " + opts.config + ": " + loaded.error, opts.json);
        return false;
    }
    out = loaded.options;
    return true;
}

} // namespace upkg::cli
