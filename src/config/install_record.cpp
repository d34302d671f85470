#include "upkg/install_record.hpp"
#include "upkg/manifest.hpp"
#include "upkg/platform.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <unordered_set>

namespace upkg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

template <typename T>
T get_unsigned(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<T>();
    }
    return T{};
}

} // namespace

InstallRecord make_install_record(const Manifest& manifest,
                                  const std::vector<std::string>& installed_paths) {
    InstallRecord record;
    record.package.name = manifest.name;
    record.package.version = manifest.version.value_or("");
    record.package.release = manifest.release.value_or("");
    record.package.summary = manifest.summary;
    record.package.license = manifest.license;
    record.package.architecture = manifest.architecture;

    std::unordered_set<std::string> installed(installed_paths.begin(), installed_paths.end());
    for (const auto& entry : manifest.files) {
        if (!installed.count(entry.path)) {
            continue;
        }
        InstallRecord::RecordedFile f;
        f.path = entry.path;
        f.type = entry.type;
        f.hash = entry.hash;
        f.mode = entry.mode;
        f.uid = entry.uid;
        f.gid = entry.gid;
        f.size = entry.size;
        record.files.push_back(std::move(f));
    }

    record.provenance.installed_at = get_current_timestamp();
    record.provenance.instance_id = generate_uuid();
    return record;
}

std::string serialize_install_record(const InstallRecord& record) {
    nlohmann::json j;
    j["$schema"] = record.schema;

    j["package"] = {
        {"name", record.package.name},
        {"version", record.package.version},
        {"release", record.package.release},
        {"summary", record.package.summary},
        {"license", record.package.license},
        {"architecture", record.package.architecture},
    };

    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : record.files) {
        files.push_back({
            {"path", f.path},
            {"type", f.type},
            {"hash", f.hash},
            {"mode", format_mode(f.mode)},
            {"uid", f.uid},
            {"gid", f.gid},
            {"size", f.size},
        });
    }
    j["files"] = files;

    j["provenance"] = {
        {"source", record.provenance.source},
        {"archive", record.provenance.archive},
        {"archive_sha256", record.provenance.archive_sha256},
        {"installed_at", record.provenance.installed_at},
        {"verification_policy", record.provenance.verification_policy},
        {"instance_id", record.provenance.instance_id},
    };

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : record.warnings) {
        nlohmann::json obj;
        obj["key"] = w.key;
        for (const auto& [k, v] : w.fields) {
            obj[k] = v;
        }
        warnings.push_back(obj);
    }
    j["warnings"] = warnings;

    // Non-UTF-8 file names are written with U+FFFD substitutions
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

InstallRecordParseResult parse_install_record(const std::string& json_str) {
    InstallRecordParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.record.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }
        if (result.record.schema != INSTALL_RECORD_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + INSTALL_RECORD_SCHEMA;
            return result;
        }

        // "package" section (REQUIRED)
        if (!j.contains("package") || !j["package"].is_object()) {
            result.error = "package section missing";
            return result;
        }
        const auto& package = j["package"];
        auto name = get_string(package, "name");
        if (!name || trim(*name).empty()) {
            result.error = "package.name missing";
            return result;
        }
        result.record.package.name = *name;
        result.record.package.version = get_string(package, "version").value_or("");
        result.record.package.release = get_string(package, "release").value_or("");
        result.record.package.summary = get_string(package, "summary").value_or("");
        result.record.package.license = get_string(package, "license").value_or("");
        result.record.package.architecture = get_string(package, "architecture").value_or("");

        // "files"
        if (j.contains("files") && j["files"].is_array()) {
            size_t index = 0;
            for (const auto& f : j["files"]) {
                InstallRecord::RecordedFile file;
                auto path = f.is_object() ? get_string(f, "path") : std::nullopt;
                if (!path || trim(*path).empty()) {
                    result.error = "files[" + std::to_string(index) + "].path missing";
                    return result;
                }
                file.path = *path;
                file.type = get_string(f, "type").value_or("");
                file.hash = get_string(f, "hash").value_or("");
                if (auto mode = get_string(f, "mode")) {
                    file.mode = parse_mode_string(*mode).value_or(0);
                }
                file.uid = get_unsigned<uint32_t>(f, "uid");
                file.gid = get_unsigned<uint32_t>(f, "gid");
                file.size = get_unsigned<uint64_t>(f, "size");
                result.record.files.push_back(std::move(file));
                ++index;
            }
        }

        // "provenance"
        if (j.contains("provenance") && j["provenance"].is_object()) {
            const auto& prov = j["provenance"];
            result.record.provenance.source = get_string(prov, "source").value_or("");
            result.record.provenance.archive = get_string(prov, "archive").value_or("");
            result.record.provenance.archive_sha256 = get_string(prov, "archive_sha256").value_or("");
            result.record.provenance.installed_at = get_string(prov, "installed_at").value_or("");
            result.record.provenance.verification_policy =
                get_string(prov, "verification_policy").value_or("");
            result.record.provenance.instance_id = get_string(prov, "instance_id").value_or("");
        }

        // "warnings"
        if (j.contains("warnings") && j["warnings"].is_array()) {
            for (const auto& w : j["warnings"]) {
                if (!w.is_object()) continue;
                WarningObject obj;
                obj.key = get_string(w, "key").value_or("");
                for (auto& [key, val] : w.items()) {
                    if (key != "key" && val.is_string()) {
                        obj.fields[key] = val.get<std::string>();
                    }
                }
                result.record.warnings.push_back(std::move(obj));
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string install_record_path(const std::string& target_root, const std::string& package_name) {
    return join_path(join_path(target_root, INSTALL_RECORD_DIR), package_name + ".json");
}

RecordWriteResult write_install_record(const std::string& target_root, const InstallRecord& record) {
    RecordWriteResult result;
    result.path = install_record_path(target_root, record.package.name);

    // Remember the outermost directory this write creates so a later
    // failure can remove it again
    const std::string& name = record.package.name;
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        result.error = "package name cannot be used as a record file name: '" + name + "'";
        return result;
    }

    std::string dir = get_parent_directory(result.path);
    for (const char* part : {"var", "var/lib", "var/lib/upkg", "var/lib/upkg/installed"}) {
        std::string current = join_path(target_root, part);
        if (!path_exists(current)) {
            result.created_directory = true;
            result.created_root = current;
            break;
        }
    }

    if (!create_directories(dir)) {
        result.error = "failed to create record directory: " + dir;
        return result;
    }

    auto written = atomic_write_file(result.path, serialize_install_record(record));
    if (!written.ok) {
        result.error = "failed to write install record: " + written.error;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace upkg
