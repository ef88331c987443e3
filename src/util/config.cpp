#include <depot/config.hpp>
#include <depot/registry_index.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace depot {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [registry] section
    if (auto registry = doc["registry"].as_table()) {
        if (auto v = (*registry)["path"].value<std::string>()) {
            cfg.registry.path = *v;
            cfg.registry_path_set = true;
        }
    }

    // [resolve] section
    if (auto resolve = doc["resolve"].as_table()) {
        if (auto node = (*resolve)["no-local"]) {
            auto v = node.value<bool>();
            if (!v) {
                return DepotError{DepotError::Config,
                    "[resolve] no-local must be a boolean"};
            }
            cfg.resolve.no_local = *v;
            cfg.resolve_no_local_set = true;
        }
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto v = (*log_tbl)["level"].value<std::string>()) {
            auto level = log::parse_level(*v);
            if (level.is_err()) return std::move(level).error();
            cfg.logging.level = level.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*log_tbl)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError{DepotError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.registry_path_set) {
        registry.path = other.registry.path;
        registry_path_set = true;
    }
    if (other.resolve_no_local_set) {
        resolve.no_local = other.resolve.no_local;
        resolve_no_local_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string Config::registry_path() const {
    if (registry_path_set && !registry.path.empty()) return registry.path;
    return RegistryIndex::default_index_path();
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.depot/config.toml";
}

std::string project_config_path(const std::string& project_root) {
    return (std::filesystem::path(project_root) / ".depot" / "config.toml").string();
}

Result<std::optional<Config>> load_optional_config(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

} // namespace depot
