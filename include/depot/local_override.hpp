#pragma once

#include <depot/result.hpp>
#include <depot/requirement.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace depot {

// File name of the developer-local override file beside Depot.toml
inline const std::string LOCAL_OVERRIDE_FILE = "Depot.local";

struct OverrideSource {
    enum class Kind { Path, Registry };
    Kind kind;
    std::string path;     // Kind::Path: as written, relative to the project root
    std::string version;  // Kind::Registry: version requirement
};

struct LocalOverrides {
    std::map<std::string, OverrideSource> overrides;

    // Load from a Depot.local file
    static Result<LocalOverrides> load(const std::filesystem::path& local_file);

    // Parse from TOML string
    static Result<LocalOverrides> parse(const std::string& toml_str);

    bool has_override(const std::string& name) const;
    const OverrideSource* get_override(const std::string& name) const;
    size_t count() const;
    bool empty() const;

    // Path overrides must name directories holding a Depot.toml.
    // Relative paths are checked against project_root.
    Status validate(const std::filesystem::path& project_root) const;

    // Warn about active overrides via depot::log::warn
    void warn_active() const;

    // Root requirements with override = true, one per entry
    Result<std::vector<Requirement>> to_requirements(
        const std::filesystem::path& project_root) const;
};

// Look for Depot.local in project_root. Returns empty LocalOverrides if not found.
Result<LocalOverrides> discover_local_overrides(const std::filesystem::path& project_root);

// Check if overrides should be suppressed (no_local flag or DEPOT_NO_LOCAL=1 env)
bool should_suppress_overrides(bool no_local_flag);

} // namespace depot
