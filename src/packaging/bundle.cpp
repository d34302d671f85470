#include "upkg/bundle.hpp"
#include "upkg/manifest.hpp"
#include "upkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace upkg {

const std::vector<std::string>& content_archive_names() {
    static const std::vector<std::string> names = {
        "install.tar.xz",
        "install.tar.gz",
        "install.tar",
    };
    return names;
}

std::unique_ptr<ByteSource> ContentArchive::open(std::string& error) const {
    if (!open_raw) {
        error = "bundle has no content archive";
        return nullptr;
    }
    auto raw = open_raw(error);
    if (!raw) {
        return nullptr;
    }
    return make_decoder(compression, std::move(raw));
}

namespace {

BundleOpenResult fail(ErrorKind kind, const std::string& error) {
    BundleOpenResult result;
    result.error_kind = kind;
    result.error = error;
    return result;
}

bool finish_manifest(BundleOpenResult& result,
                     const std::string& metadata_xml,
                     const std::string& files_xml) {
    auto parsed = parse_manifest(metadata_xml, files_xml);
    if (!parsed.ok) {
        result.error_kind = ErrorKind::ParseError;
        result.error = parsed.error;
        return false;
    }
    result.bundle.manifest = std::move(parsed.manifest);
    return true;
}

BundleOpenResult open_directory_bundle(const std::string& dir) {
    BundleOpenResult result;
    result.bundle.source_path = dir;
    result.bundle.kind = BundleKind::Directory;

    auto metadata = read_file(join_path(dir, METADATA_DOCUMENT));
    if (!metadata) {
        return fail(ErrorKind::ParseError, std::string("bundle is missing ") + METADATA_DOCUMENT);
    }
    auto files = read_file(join_path(dir, FILES_DOCUMENT));
    if (!files) {
        return fail(ErrorKind::ParseError, std::string("bundle is missing ") + FILES_DOCUMENT);
    }

    for (const auto& name : content_archive_names()) {
        std::string archive_path = join_path(dir, name);
        if (!is_regular_file(archive_path)) {
            continue;
        }
        std::error_code ec;
        auto size = fs::file_size(archive_path, ec);

        ContentArchive& archive = result.bundle.archive;
        archive.name = name;
        archive.compression = compression_from_name(name);
        archive.stored_size = ec ? 0 : static_cast<uint64_t>(size);
        archive.open_raw = [archive_path](std::string& error) -> std::unique_ptr<ByteSource> {
            auto source = std::make_unique<FileByteSource>(archive_path);
            if (!source->is_open()) {
                error = source->error();
                return nullptr;
            }
            return source;
        };
        break;
    }

    if (!result.bundle.archive.open_raw) {
        return fail(ErrorKind::ArchiveError, "bundle has no content archive (install.tar.xz)");
    }

    if (!finish_manifest(result, *metadata, *files)) {
        return result;
    }

    result.ok = true;
    return result;
}

BundleOpenResult open_container_bundle(const std::string& zip_path) {
    BundleOpenResult result;
    result.bundle.source_path = zip_path;
    result.bundle.kind = BundleKind::Container;

    auto index = read_zip_index(zip_path);
    if (!index.ok) {
        return fail(ErrorKind::ArchiveError, index.error);
    }

    const ZipEntry* metadata_entry = nullptr;
    const ZipEntry* files_entry = nullptr;
    const ZipEntry* archive_entry = nullptr;
    size_t archive_rank = content_archive_names().size();

    for (const auto& entry : index.entries) {
        if (entry.name == METADATA_DOCUMENT) {
            metadata_entry = &entry;
        } else if (entry.name == FILES_DOCUMENT) {
            files_entry = &entry;
        } else {
            const auto& names = content_archive_names();
            for (size_t i = 0; i < names.size() && i < archive_rank; ++i) {
                if (entry.name == names[i]) {
                    archive_entry = &entry;
                    archive_rank = i;
                }
            }
        }
    }

    if (!metadata_entry) {
        return fail(ErrorKind::ParseError, std::string("container is missing ") + METADATA_DOCUMENT);
    }
    if (!files_entry) {
        return fail(ErrorKind::ParseError, std::string("container is missing ") + FILES_DOCUMENT);
    }
    if (!archive_entry) {
        return fail(ErrorKind::ArchiveError, "container has no content archive (install.tar.xz)");
    }

    std::string error;
    auto metadata = read_zip_entry(zip_path, *metadata_entry, error);
    if (!metadata) {
        return fail(ErrorKind::ArchiveError, error);
    }
    auto files = read_zip_entry(zip_path, *files_entry, error);
    if (!files) {
        return fail(ErrorKind::ArchiveError, error);
    }

    ContentArchive& archive = result.bundle.archive;
    archive.name = archive_entry->name;
    archive.compression = compression_from_name(archive_entry->name);
    archive.stored_size = archive_entry->uncompressed_size;
    ZipEntry member = *archive_entry;
    archive.open_raw = [zip_path, member](std::string& err) {
        return open_zip_entry(zip_path, member, err);
    };

    if (!finish_manifest(result, *metadata, *files)) {
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace

BundleOpenResult open_bundle(const std::string& path) {
    if (!path_exists(path)) {
        return fail(ErrorKind::IOError, "package not found: " + path);
    }

    BundleOpenResult result = is_directory(path) ? open_directory_bundle(path)
                                                 : open_container_bundle(path);
    if (result.ok) {
        spdlog::debug("opened {} bundle {} ({} entries, archive {})",
                      bundle_kind_to_string(result.bundle.kind), path,
                      result.bundle.manifest.files.size(), result.bundle.archive.name);
    }
    return result;
}

} // namespace upkg
