/**
 * upkg CLI - install command
 *
 * Install a native bundle through the engine, or hand a foreign package
 * to the distribution's own installer.
 */

#include "../common.hpp"

#include <upkg/dispatch.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdlib>
#include <memory>

namespace upkg::cli::commands {

namespace {

struct InstallCommandOptions {
    std::string package;
    bool force = false;
    std::string root;
    std::string staging_dir;
    bool permissive = false;
    size_t jobs = 0;
    bool no_record = false;
};

// SIGINT/SIGTERM request cancellation; the engine rolls back and exits cleanly
CancellationToken* g_cancel = nullptr;

extern "C" void handle_interrupt(int) {
    if (g_cancel) {
        g_cancel->cancel();
    }
}

nlohmann::json result_to_json(const InstallResult& result) {
    nlohmann::json j;
    j["ok"] = result.ok;
    j["package"] = result.manifest.name;
    if (result.manifest.version) {
        j["version"] = *result.manifest.version;
    }
    j["stage"] = install_stage_to_string(result.stage);
    j["installed"] = result.installed;
    j["skipped"] = result.plan.skip_count;
    if (!result.record_path.empty()) {
        j["record"] = result.record_path;
    }
    j["warnings"] = warnings_to_json(result.warnings);
    return j;
}

int install_native(const GlobalOptions& opts, const InstallCommandOptions& cmd, CLI::App* app) {
    InstallOptions options;
    if (!load_base_options(opts, options)) {
        return EXIT_USAGE;
    }

    // Flags override config
    if (cmd.force) options.force = true;
    if (!cmd.root.empty()) options.target_root = cmd.root;
    if (!cmd.staging_dir.empty()) options.staging_root = cmd.staging_dir;
    if (cmd.permissive) options.policy = VerifyPolicy::Permissive;
    if (app->count("--jobs") > 0) options.jobs = cmd.jobs;
    if (cmd.no_record) options.write_record = false;

    auto token = std::make_shared<CancellationToken>();
    options.cancel = token;
    g_cancel = token.get();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    if (opts.verbose && !opts.json) {
        options.progress = [](const PlannedAction& action, size_t done, size_t total) {
            std::cerr << "[" << done << "/" << total << "] " << action.entry.path << std::endl;
        };
    }

    auto result = install_bundle(cmd.package, options);

    g_cancel = nullptr;
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (!result.ok) {
        print_error(result.error, opts.json, error_kind_to_string(result.error_kind), result.warnings);
        return exit_code_for(result.error_kind);
    }

    if (opts.json) {
        output_json(result_to_json(result));
    } else {
        if (!opts.quiet) {
            std::string version = result.manifest.version ? " " + *result.manifest.version : "";
            print_success("Installed " + result.manifest.name + version + " (" +
                          std::to_string(result.installed.size()) + " entries) into " +
                          options.target_root, opts.json);
            if (result.plan.skip_count > 0) {
                print_success("  " + std::to_string(result.plan.skip_count) + " entries skipped",
                              opts.json);
            }
        }
    }
    return EXIT_OK;
}

int cmd_install(const GlobalOptions& opts, const InstallCommandOptions& cmd, CLI::App* app) {
    configure_logging(opts);

    auto format = detect_package_format(cmd.package);
    switch (select_backend(format)) {
        case Backend::Native:
            return install_native(opts, cmd, app);

        case Backend::Foreign: {
            auto exec = run_foreign_installer(format, cmd.package, cmd.force);
            if (!exec.ok) {
                print_error(exec.error, opts.json);
                return EXIT_IO;
            }
            if (opts.json) {
                nlohmann::json j;
                j["ok"] = exec.exit_code == 0;
                j["format"] = package_format_to_string(format);
                j["exit_code"] = exec.exit_code;
                output_json(j);
            } else if (exec.exit_code != 0) {
                print_error(std::string(package_format_to_string(format)) +
                            " installer exited with status " + std::to_string(exec.exit_code),
                            false);
            }
            return exec.exit_code;
        }

        case Backend::Unsupported:
        default:
            print_error("unsupported package format: " + cmd.package, opts.json);
            return EXIT_UNSUPPORTED;
    }
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallCommandOptions cmd;

    app->add_option("package", cmd.package, "Bundle directory, .eopkg, or foreign package")->required();
    app->add_flag("-f,--force", cmd.force, "Replace existing files");
    app->add_option("--root", cmd.root, "Target root directory (default /)");
    app->add_option("--staging-dir", cmd.staging_dir, "Directory for staging areas and locks");
    app->add_flag("--permissive", cmd.permissive, "Skip entries that fail verification instead of aborting");
    app->add_option("-j,--jobs", cmd.jobs, "Verification workers (default: CPU count)");
    app->add_flag("--no-record", cmd.no_record, "Do not write an install record");

    app->callback([&opts, app]() {
        std::exit(cmd_install(opts, cmd, app));
    });
}

} // namespace upkg::cli::commands
