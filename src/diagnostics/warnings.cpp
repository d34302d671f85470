#include "upkg/warnings.hpp"

#include <algorithm>
#include <map>

#include <spdlog/spdlog.h>

namespace upkg {

void WarningCollector::emit(Warning warning,
                            const std::unordered_map<std::string, std::string>& fields) {
    WarningObject obj;
    obj.key = warning_to_string(warning);
    obj.fields = fields;
    spdlog::warn("{}", format_warning(obj));
    warnings_.push_back(std::move(obj));
}

void WarningCollector::emit_for_path(Warning warning, const std::string& path,
                                     const std::string& detail) {
    std::unordered_map<std::string, std::string> fields{{"path", path}};
    if (!detail.empty()) {
        fields["detail"] = detail;
    }
    emit(warning, fields);
}

size_t WarningCollector::count(Warning warning) const {
    const std::string key = warning_to_string(warning);
    return static_cast<size_t>(std::count_if(warnings_.begin(), warnings_.end(),
        [&key](const WarningObject& w) { return w.key == key; }));
}

std::string format_warning(const WarningObject& warning) {
    std::string line = warning.key;

    // "path" first, remaining fields sorted for stable output
    auto path_it = warning.fields.find("path");
    if (path_it != warning.fields.end()) {
        line += ": " + path_it->second;
    }

    std::map<std::string, std::string> rest;
    for (const auto& [k, v] : warning.fields) {
        if (k != "path") rest.emplace(k, v);
    }
    for (const auto& [k, v] : rest) {
        line += " " + k + "=" + v;
    }
    return line;
}

} // namespace upkg
