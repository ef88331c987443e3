#include <depot/requirement.hpp>
#include <depot/name.hpp>

namespace depot {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// DependencySource
// ---------------------------------------------------------------------------

std::string DependencySource::to_string() const {
    if (kind == Kind::Path) return "path+" + path;
    return "registry";
}

Result<DependencySource> DependencySource::from_string(const std::string& s) {
    if (s == "registry") {
        return Result<DependencySource>::ok(registry());
    }
    if (s.rfind("path+", 0) == 0 && s.size() > 5) {
        return Result<DependencySource>::ok(at_path(s.substr(5)));
    }
    return DepotError{DepotError::Parse,
        "unknown source '" + s + "'",
        "expected 'registry' or 'path+<dir>'"};
}

// ---------------------------------------------------------------------------
// RawRequirement::validate
// ---------------------------------------------------------------------------

Status RawRequirement::validate() const {
    auto pkg_name = PkgName::parse(name);
    if (pkg_name.is_err()) {
        return DepotError{DepotError::InvalidDeclaration,
            "invalid dependency name: " + pkg_name.error().message,
            pkg_name.error().hint};
    }

    if (!requirement && !path) {
        return DepotError{DepotError::InvalidDeclaration,
            "dependency '" + name + "' has no source",
            "give a version requirement or a path"};
    }

    if (path) {
        if (path->empty()) {
            return DepotError{DepotError::InvalidDeclaration,
                "dependency '" + name + "' has an empty path"};
        }
        if (package) {
            return DepotError{DepotError::InvalidDeclaration,
                "path dependency '" + name + "' cannot set 'package'",
                "'package' names a registry package; drop it or drop 'path'"};
        }
        if (requirement && override) {
            return DepotError{DepotError::InvalidDeclaration,
                "override '" + name + "' has both a path and a registry requirement",
                "an override picks exactly one source"};
        }
    }

    if (package) {
        auto published = PkgName::parse(*package);
        if (published.is_err()) {
            return DepotError{DepotError::InvalidDeclaration,
                "dependency '" + name + "' has invalid package name: " +
                published.error().message};
        }
    }

    if (requirement) {
        auto req = VersionReq::parse(*requirement);
        if (req.is_err()) {
            return DepotError{DepotError::InvalidDeclaration,
                "dependency '" + name + "' has invalid version requirement: " +
                req.error().message,
                req.error().hint};
        }
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// Requirement
// ---------------------------------------------------------------------------

std::string Requirement::describe() const {
    if (is_path()) {
        return package + " (" + source.to_string() + ")";
    }
    std::string s = registry_name == package
        ? package
        : package + " (" + registry_name + ")";
    s += " ";
    s += constraint_text.empty() ? std::string("*") : constraint_text;
    return s;
}

// ---------------------------------------------------------------------------
// normalize
// ---------------------------------------------------------------------------

Result<Requirement> normalize(const RawRequirement& raw,
                              const std::string& requestor,
                              const fs::path& base_dir)
{
    DEPOT_TRY(raw.validate());

    Requirement req;
    req.requestor = requestor;
    req.package = PkgName::parse(raw.name).value().identity();
    req.app = raw.name;
    req.registry_name = raw.package ? *raw.package : raw.name;
    req.optional = raw.optional;
    req.override = raw.override;

    if (raw.requirement) {
        req.constraint_text = *raw.requirement;
        req.constraint = VersionReq::parse(*raw.requirement).value();
    }

    if (raw.path) {
        fs::path p(*raw.path);
        if (p.is_relative() && !base_dir.empty()) {
            p = base_dir / p;
        }
        p = p.lexically_normal();
        if (p.filename().empty() && p.has_parent_path()) {
            p = p.parent_path();
        }
        req.source = DependencySource::at_path(p.generic_string());
    }

    return Result<Requirement>::ok(std::move(req));
}

Result<std::vector<Requirement>> normalize_all(
    const std::vector<RawRequirement>& raws,
    const std::string& requestor,
    const fs::path& base_dir)
{
    std::vector<Requirement> out;
    out.reserve(raws.size());
    for (const auto& raw : raws) {
        auto req = normalize(raw, requestor, base_dir);
        if (req.is_err()) return std::move(req).error();
        out.push_back(std::move(req).value());
    }
    return Result<std::vector<Requirement>>::ok(std::move(out));
}

} // namespace depot
