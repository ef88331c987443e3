#pragma once

#include <depot/result.hpp>
#include <depot/version.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// Requestor recorded on every requirement the root project declares
inline const std::string ROOT_REQUESTOR = "root";

struct DependencySource {
    enum class Kind { Registry, Path };
    Kind kind = Kind::Registry;
    std::string path;  // Kind::Path: absolute, lexically normal

    static DependencySource registry() { return DependencySource{}; }
    static DependencySource at_path(std::string p) {
        return DependencySource{Kind::Path, std::move(p)};
    }

    bool is_path() const { return kind == Kind::Path; }

    // "registry" or "path+<path>"; the lock file stores this form
    std::string to_string() const;
    static Result<DependencySource> from_string(const std::string& s);

    bool operator==(const DependencySource& o) const {
        return kind == o.kind && path == o.path;
    }
    bool operator!=(const DependencySource& o) const { return !(*this == o); }
};

// A dependency exactly as a manifest or a registry release declares it
struct RawRequirement {
    std::string name;                        // local alias
    std::optional<std::string> requirement;  // version constraint
    std::optional<std::string> path;         // path source, relative to the declaring manifest
    std::optional<std::string> package;      // published registry name when it differs from name
    bool optional = false;
    bool override = false;

    // Fails with InvalidDeclaration
    Status validate() const;
};

// Canonical requirement record. Never mutated once built; the override
// engine and the resolver derive new records instead.
struct Requirement {
    std::string requestor;        // identity of the declaring package, or ROOT_REQUESTOR
    std::string package;          // PackageIdentity
    std::string app;              // alias as declared, for display
    std::string registry_name;    // name the registry is queried with
    std::string constraint_text;  // as written; empty means any version
    VersionReq constraint;
    DependencySource source;
    bool optional = false;
    bool override = false;

    bool is_path() const { return source.is_path(); }

    // "postgrex ~> 0.2.0", "ex_doc (path+/src/ex_doc)"
    std::string describe() const;
};

Result<Requirement> normalize(const RawRequirement& raw,
                              const std::string& requestor,
                              const std::filesystem::path& base_dir = {});

Result<std::vector<Requirement>> normalize_all(
    const std::vector<RawRequirement>& raws,
    const std::string& requestor,
    const std::filesystem::path& base_dir = {});

} // namespace depot
