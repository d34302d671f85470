/**
 * upkg CLI - verify command
 *
 * Extracts a bundle into a staging area and checks every declared entry
 * against its hash. Nothing is installed.
 */

#include "../common.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>

namespace upkg::cli::commands {

namespace {

struct VerifyOptions {
    std::string package;
    std::string staging_dir;
    size_t jobs = 0;
};

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts, CLI::App* app) {
    configure_logging(opts);

    InstallOptions options;
    if (!load_base_options(opts, options)) {
        return EXIT_USAGE;
    }
    if (!verify_opts.staging_dir.empty()) options.staging_root = verify_opts.staging_dir;
    if (app->count("--jobs") > 0) options.jobs = verify_opts.jobs;

    // Report every mismatch rather than stopping at the first
    options.policy = VerifyPolicy::Permissive;

    auto result = verify_bundle(verify_opts.package, options);
    // Failures before or during verification; unreadable entries still
    // come with a full report
    if (!result.ok && result.report.results.empty()) {
        print_error(result.error, opts.json, error_kind_to_string(result.error_kind), result.warnings);
        return exit_code_for(result.error_kind);
    }

    const auto& report = result.report;
    bool clean = report.mismatched == 0 && report.unreadable == 0;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = clean;
        j["package"] = result.manifest.name;
        j["matched"] = report.matched;
        j["mismatched"] = report.mismatched;
        j["unreadable"] = report.unreadable;

        nlohmann::json failures = nlohmann::json::array();
        for (const auto& r : report.results) {
            if (r.verdict == Verdict::Match) continue;
            nlohmann::json f;
            f["path"] = r.path;
            f["verdict"] = verdict_to_string(r.verdict);
            if (r.verdict == Verdict::Mismatch) {
                f["expected"] = r.expected;
                f["actual"] = r.actual;
            } else {
                f["cause"] = r.cause;
            }
            failures.push_back(f);
        }
        j["failures"] = failures;
        j["warnings"] = warnings_to_json(result.warnings);
        output_json(j);
    } else {
        for (const auto& r : report.results) {
            if (r.verdict == Verdict::Mismatch) {
                std::cout << "MISMATCH    " << r.path << " expected " << r.expected
                          << " got " << r.actual << std::endl;
            } else if (r.verdict == Verdict::Unreadable) {
                std::cout << "UNREADABLE  " << r.path << ": " << r.cause << std::endl;
            }
        }
        if (!opts.quiet) {
            std::cout << result.manifest.name << ": " << report.matched << " ok, "
                      << report.mismatched << " mismatched, " << report.unreadable
                      << " unreadable" << std::endl;
        }
    }

    return clean ? EXIT_OK : EXIT_INTEGRITY;
}

} // anonymous namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("package", verify_opts.package, "Bundle directory or .eopkg file")->required();
    app->add_option("--staging-dir", verify_opts.staging_dir, "Directory for the staging area");
    app->add_option("-j,--jobs", verify_opts.jobs, "Verification workers (default: CPU count)");

    app->callback([&opts, app]() {
        std::exit(cmd_verify(opts, verify_opts, app));
    });
}

} // namespace upkg::cli::commands
