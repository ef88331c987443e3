#pragma once

#include <depot/result.hpp>
#include <depot/log.hpp>
#include <string>
#include <optional>

namespace depot {

struct RegistryConfig {
    std::string path;  // SQLite registry index; empty means the default
};

struct ResolveConfig {
    bool no_local = false;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = true;
};

// Layered configuration: global (~/.depot/config.toml), then project
// (<root>/.depot/config.toml). Later layers override only what they set.
struct Config {
    RegistryConfig registry;
    ResolveConfig resolve;
    LogConfig logging;
    // Track which fields were explicitly set (for merge)
    bool registry_path_set = false;
    bool resolve_no_local_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file (global or project-level)
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Registry index path, falling back to ~/.depot/registry.db
    std::string registry_path() const;

    // Push the explicitly set log settings into depot::log
    void apply_logging() const;
};

// Discover the global config file path: ~/.depot/config.toml
std::string global_config_path();

// <project_root>/.depot/config.toml
std::string project_config_path(const std::string& project_root);

// Loads a config layer if its file exists; a missing file gives nullopt
Result<std::optional<Config>> load_optional_config(const std::string& path);

} // namespace depot
