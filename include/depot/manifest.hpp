#pragma once

#include <depot/result.hpp>
#include <depot/requirement.hpp>
#include <toml++/toml.hpp>
#include <string>
#include <vector>

namespace depot {

// [package] section
struct PackageInfo {
    std::string name;
    std::string version;
};

// Depot.toml
struct Manifest {
    PackageInfo package;
    std::vector<RawRequirement> dependencies;  // declaration order

    static Result<Manifest> parse(const std::string& toml_str);
    static Result<Manifest> load(const std::string& path);

    const RawRequirement* find_dependency(const std::string& name) const;
};

// Parses a [dependencies]-style table in declaration order. Each entry is
// either a requirement string or a table with any of: version, path,
// package, optional, override.
Result<std::vector<RawRequirement>> parse_dependencies(const toml::table& tbl);

} // namespace depot
