#include "upkg/engine.hpp"
#include "upkg/platform.hpp"

#include <nlohmann/json.hpp>

namespace upkg {

namespace {

bool read_string(const nlohmann::json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) {
        error = std::string(key) + " must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

} // namespace

OptionsLoadResult load_install_options_json(const std::string& json_str, const InstallOptions& base) {
    OptionsLoadResult result;
    result.options = base;
    InstallOptions& opts = result.options;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            result.error = "config must be a JSON object";
            return result;
        }

        if (!read_string(j, "target_root", opts.target_root, result.error) ||
            !read_string(j, "staging_root", opts.staging_root, result.error) ||
            !read_bool(j, "force", opts.force, result.error) ||
            !read_bool(j, "write_record", opts.write_record, result.error)) {
            return result;
        }

        if (j.contains("verification_policy")) {
            const auto& v = j["verification_policy"];
            auto policy = v.is_string() ? parse_verify_policy(v.get<std::string>()) : std::nullopt;
            if (!policy) {
                result.error = "verification_policy must be \"strict\" or \"permissive\"";
                return result;
            }
            opts.policy = *policy;
        }

        if (j.contains("jobs")) {
            if (!j["jobs"].is_number_unsigned()) {
                result.error = "jobs must be a non-negative integer";
                return result;
            }
            opts.jobs = j["jobs"].get<size_t>();
        }

        if (opts.target_root.empty()) {
            result.error = "target_root must not be empty";
            return result;
        }
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

OptionsLoadResult load_install_options_file(const std::string& path, const InstallOptions& base) {
    auto content = read_file(path);
    if (!content) {
        OptionsLoadResult result;
        result.options = base;
        result.error = "failed to read config file: " + path;
        return result;
    }
    return load_install_options_json(*content, base);
}

} // namespace upkg
