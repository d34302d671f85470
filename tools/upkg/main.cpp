/**
 * upkg CLI - Entry Point
 *
 * Verified package installation.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace upkg::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_info(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace upkg::cli;

    CLI::App app{"upkg - verified package installer"};
    app.set_version_flag("-V,--version", UPKG_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "JSON configuration file")->check(CLI::ExistingFile);
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install a package");
    commands::setup_install(install_cmd, opts);

    auto* info_cmd = app.add_subcommand("info", "Show package metadata and contents");
    commands::setup_info(info_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check a package's contents against its hashes");
    commands::setup_verify(verify_cmd, opts);

    // Usage errors map to a single exit code; --help and --version exit 0
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? EXIT_OK : EXIT_USAGE;
    }

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return EXIT_OK;
}
