#pragma once

#include "upkg/types.hpp"

#include <string>
#include <vector>

namespace upkg {

constexpr const char* INSTALL_RECORD_SCHEMA = "upkg.install.v1";

// Records live under the target root, relative to it
constexpr const char* INSTALL_RECORD_DIR = "var/lib/upkg/installed";

// ============================================================================
// Install Record
// ============================================================================

struct InstallRecord {
    std::string schema = INSTALL_RECORD_SCHEMA;

    struct {
        std::string name;
        std::string version;
        std::string release;
        std::string summary;
        std::string license;
        std::string architecture;
    } package;

    struct RecordedFile {
        std::string path;
        std::string type;
        std::string hash;
        uint32_t mode = 0;
        uint32_t uid = 0;
        uint32_t gid = 0;
        uint64_t size = 0;
    };
    std::vector<RecordedFile> files;  // installed entries only

    struct {
        std::string source;          // package path as given
        std::string archive;         // content archive name
        std::string archive_sha256;
        std::string installed_at;    // RFC3339
        std::string verification_policy;
        std::string instance_id;
    } provenance;

    std::vector<WarningObject> warnings;
};

struct InstallRecordParseResult {
    bool ok = false;
    std::string error;
    InstallRecord record;
};

// Snapshot of a manifest; only entries listed in installed_paths are recorded
InstallRecord make_install_record(const Manifest& manifest,
                                  const std::vector<std::string>& installed_paths);

std::string serialize_install_record(const InstallRecord& record);

InstallRecordParseResult parse_install_record(const std::string& json_str);

// <target_root>/var/lib/upkg/installed/<name>.json
std::string install_record_path(const std::string& target_root, const std::string& package_name);

struct RecordWriteResult {
    bool ok = false;
    std::string error;
    std::string path;
    bool created_directory = false;  // first directory component created, if any
    std::string created_root;
};

// Write the record atomically, creating the record directory if needed
RecordWriteResult write_install_record(const std::string& target_root, const InstallRecord& record);

} // namespace upkg
