#pragma once

#include <depot/result.hpp>
#include <depot/manifest.hpp>
#include <string>

namespace depot {

// File name of a package manifest inside a package directory
inline const std::string MANIFEST_FILE = "Depot.toml";

// Reads the manifest of a path-sourced package
class PathSource {
public:
    virtual ~PathSource() = default;

    // Fails with PathNotFound or InvalidManifest
    virtual Result<Manifest> read_manifest(const std::string& path) = 0;
};

// Reads <path>/Depot.toml from the local filesystem
class FsPathSource : public PathSource {
public:
    Result<Manifest> read_manifest(const std::string& path) override;
};

} // namespace depot
