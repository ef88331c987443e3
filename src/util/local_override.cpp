#include <depot/local_override.hpp>
#include <depot/log.hpp>
#include <depot/name.hpp>
#include <depot/path_source.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace depot {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// LocalOverrides::parse
// ---------------------------------------------------------------------------

Result<LocalOverrides> LocalOverrides::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("Depot.local parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    LocalOverrides lo;

    auto* overrides_tbl = doc["overrides"].as_table();
    if (!overrides_tbl) {
        return Result<LocalOverrides>::ok(std::move(lo));
    }

    for (const auto& [key, val] : *overrides_tbl) {
        std::string name(key);

        auto identity = package_identity(name);
        if (identity.is_err()) {
            return DepotError{DepotError::InvalidDeclaration,
                "override '" + name + "': " + identity.error().message};
        }

        if (!val.is_table()) {
            return DepotError{DepotError::Parse,
                "override '" + name + "' must be a table"};
        }
        const auto& tbl = *val.as_table();

        auto path_val = tbl["path"].value<std::string>();
        auto version_val = tbl["version"].value<std::string>();

        if (path_val && version_val) {
            return DepotError{DepotError::InvalidDeclaration,
                "override '" + name + "' cannot have both 'path' and 'version'"};
        }

        if (!path_val && !version_val) {
            return DepotError{DepotError::InvalidDeclaration,
                "override '" + name + "' must have either 'path' or 'version'"};
        }

        OverrideSource src;
        if (path_val) {
            src.kind = OverrideSource::Kind::Path;
            src.path = *path_val;
        } else {
            auto req = VersionReq::parse(*version_val);
            if (req.is_err()) {
                return DepotError{DepotError::InvalidDeclaration,
                    "override '" + name + "': " + req.error().message,
                    req.error().hint};
            }
            src.kind = OverrideSource::Kind::Registry;
            src.version = *version_val;
        }

        lo.overrides[name] = std::move(src);
    }

    return Result<LocalOverrides>::ok(std::move(lo));
}

// ---------------------------------------------------------------------------
// LocalOverrides::load
// ---------------------------------------------------------------------------

Result<LocalOverrides> LocalOverrides::load(const fs::path& local_file) {
    std::ifstream file(local_file);
    if (!file.is_open()) {
        return DepotError{DepotError::IO,
            "cannot open local overrides file: " + local_file.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = LocalOverrides::parse(ss.str());
    if (r.is_err()) {
        r.error().file = local_file.string();
    }
    return r;
}

// ---------------------------------------------------------------------------
// Query methods
// ---------------------------------------------------------------------------

bool LocalOverrides::has_override(const std::string& name) const {
    return overrides.count(name) > 0;
}

const OverrideSource* LocalOverrides::get_override(const std::string& name) const {
    auto it = overrides.find(name);
    if (it == overrides.end()) return nullptr;
    return &it->second;
}

size_t LocalOverrides::count() const {
    return overrides.size();
}

bool LocalOverrides::empty() const {
    return overrides.empty();
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Status LocalOverrides::validate(const fs::path& project_root) const {
    for (const auto& [name, src] : overrides) {
        if (src.kind != OverrideSource::Kind::Path) continue;

        fs::path dir(src.path);
        if (dir.is_relative()) dir = project_root / dir;

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            return DepotError{DepotError::PathNotFound,
                "override '" + name + "': path does not exist or is not a directory: " + src.path};
        }
        if (!fs::exists(dir / MANIFEST_FILE, ec)) {
            return DepotError{DepotError::InvalidManifest,
                "override '" + name + "': path '" + src.path + "' does not contain a " +
                MANIFEST_FILE};
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// warn_active
// ---------------------------------------------------------------------------

void LocalOverrides::warn_active() const {
    for (const auto& [name, src] : overrides) {
        if (src.kind == OverrideSource::Kind::Path) {
            log::warn("local override active: %s -> path '%s'",
                name.c_str(), src.path.c_str());
        } else {
            log::warn("local override active: %s -> version '%s'",
                name.c_str(), src.version.c_str());
        }
    }
}

// ---------------------------------------------------------------------------
// to_requirements
// ---------------------------------------------------------------------------

Result<std::vector<Requirement>> LocalOverrides::to_requirements(
    const fs::path& project_root) const
{
    std::vector<RawRequirement> raws;
    for (const auto& [name, src] : overrides) {
        RawRequirement raw;
        raw.name = name;
        raw.override = true;
        if (src.kind == OverrideSource::Kind::Path) {
            raw.path = src.path;
        } else {
            raw.requirement = src.version;
        }
        raws.push_back(std::move(raw));
    }
    return normalize_all(raws, ROOT_REQUESTOR, project_root);
}

// ---------------------------------------------------------------------------
// Discovery and suppression
// ---------------------------------------------------------------------------

Result<LocalOverrides> discover_local_overrides(const fs::path& project_root) {
    fs::path local_file = project_root / LOCAL_OVERRIDE_FILE;
    std::error_code ec;
    if (!fs::exists(local_file, ec)) {
        return Result<LocalOverrides>::ok(LocalOverrides{});
    }
    return LocalOverrides::load(local_file);
}

bool should_suppress_overrides(bool no_local_flag) {
    if (no_local_flag) return true;
    const char* env = std::getenv("DEPOT_NO_LOCAL");
    if (env && std::string(env) == "1") return true;
    return false;
}

} // namespace depot
