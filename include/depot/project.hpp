#pragma once

#include <depot/result.hpp>
#include <depot/lockfile.hpp>
#include <depot/manifest.hpp>
#include <depot/registry.hpp>
#include <depot/resolver.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace depot {

struct Project {
    Manifest manifest;
    std::filesystem::path root_dir;       // dir containing Depot.toml
    std::filesystem::path manifest_path;  // full path to Depot.toml

    // Walk up from start_dir to find Depot.toml, then load
    static Result<Project> discover(const std::filesystem::path& start_dir);

    // Load from a specific directory (must contain Depot.toml)
    static Result<Project> load(const std::filesystem::path& project_dir);

    // <root>/Depot.lock
    std::filesystem::path lock_path() const;

    // Manifest dependencies as root requirements. Unless suppressed, each
    // Depot.local entry is added as a root override and replaces a manifest
    // override of the same package.
    Result<std::vector<Requirement>> root_requirements(bool no_local) const;
};

// Walk up from start_dir to find the nearest Depot.toml, return its path
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir);

// Check if dir contains a Depot.toml
bool has_manifest(const std::filesystem::path& dir);

struct LockOutcome {
    Resolution resolution;
    LockFile previous;          // lock as it was before the run
    bool lock_written = false;  // false when the lock was already up to date
};

// Reads the project's lock, resolves its dependencies and rewrites the lock
// if the selection changed. The lock is untouched on any failure.
Result<LockOutcome> lock_project(const Project& project, Registry& registry,
                                 const ResolveOptions& options = {});

// Same, with path dependencies read through paths
Result<LockOutcome> lock_project(const Project& project, Registry& registry,
                                 PathSource& paths,
                                 const ResolveOptions& options = {});

} // namespace depot
