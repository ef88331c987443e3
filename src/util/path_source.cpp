#include <depot/path_source.hpp>
#include <filesystem>

namespace depot {

namespace fs = std::filesystem;

Result<Manifest> FsPathSource::read_manifest(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return DepotError{DepotError::PathNotFound,
            "path dependency directory does not exist: " + path};
    }

    fs::path manifest_file = fs::path(path) / MANIFEST_FILE;
    if (!fs::exists(manifest_file, ec)) {
        return DepotError{DepotError::InvalidManifest,
            "no " + MANIFEST_FILE + " found in " + path};
    }

    auto manifest = Manifest::load(manifest_file.string());
    if (manifest.is_err()) {
        auto err = std::move(manifest).error();
        return DepotError{DepotError::InvalidManifest,
            "invalid manifest for path dependency: " + err.message,
            err.hint, err.file, err.line};
    }
    return manifest;
}

} // namespace depot
