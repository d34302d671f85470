/**
 * upkg CLI - info command
 */

#include "../common.hpp"

#include <upkg/bundle.hpp>
#include <upkg/manifest.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>

namespace upkg::cli::commands {

namespace {

struct InfoOptions {
    std::string package;
};

int cmd_info(const GlobalOptions& opts, const InfoOptions& info_opts) {
    configure_logging(opts);

    auto opened = open_bundle(info_opts.package);
    if (!opened.ok) {
        print_error(opened.error, opts.json, error_kind_to_string(opened.error_kind));
        return exit_code_for(opened.error_kind);
    }

    const PackageBundle& bundle = opened.bundle;
    const Manifest& m = bundle.manifest;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["name"] = m.name;
        j["version"] = m.version ? nlohmann::json(*m.version) : nlohmann::json(nullptr);
        j["release"] = m.release ? nlohmann::json(*m.release) : nlohmann::json(nullptr);
        j["summary"] = m.summary;
        j["description"] = m.description;
        j["license"] = m.license;
        j["architecture"] = m.architecture;
        j["homepage"] = m.homepage;
        j["packager"] = m.packager;
        j["bundle"] = bundle_kind_to_string(bundle.kind);
        j["archive"] = bundle.archive.name;

        nlohmann::json files = nlohmann::json::array();
        for (const auto& f : m.files) {
            files.push_back({
                {"path", f.path},
                {"type", f.type},
                {"size", f.size},
                {"mode", format_mode(f.mode)},
                {"uid", f.uid},
                {"gid", f.gid},
                {"hash", f.hash},
            });
        }
        j["files"] = files;
        output_json(j);
        return EXIT_OK;
    }

    std::cout << "Name:         " << m.name << std::endl;
    if (m.version) {
        std::cout << "Version:      " << *m.version;
        if (m.release) std::cout << " (release " << *m.release << ")";
        std::cout << std::endl;
    }
    if (!m.summary.empty()) std::cout << "Summary:      " << m.summary << std::endl;
    if (!m.license.empty()) std::cout << "License:      " << m.license << std::endl;
    if (!m.architecture.empty()) std::cout << "Architecture: " << m.architecture << std::endl;
    if (!m.homepage.empty()) std::cout << "Homepage:     " << m.homepage << std::endl;
    if (!m.packager.empty()) std::cout << "Packager:     " << m.packager << std::endl;
    std::cout << "Archive:      " << bundle.archive.name << " ("
              << compression_to_string(bundle.archive.compression) << ")" << std::endl;

    if (!m.description.empty()) {
        std::cout << std::endl << m.description << std::endl;
    }

    if (!opts.quiet) {
        std::cout << std::endl << "Files (" << m.files.size() << "):" << std::endl;
        for (const auto& f : m.files) {
            std::cout << "  " << format_mode(f.mode) << " " << f.uid << ":" << f.gid << "  "
                      << f.path;
            if (f.kind == FileKind::Directory) std::cout << "/";
            std::cout << std::endl;
        }
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_info(CLI::App* app, GlobalOptions& opts) {
    static InfoOptions info_opts;

    app->add_option("package", info_opts.package, "Bundle directory or .eopkg file")->required();

    app->callback([&opts]() {
        std::exit(cmd_info(opts, info_opts));
    });
}

} // namespace upkg::cli::commands
