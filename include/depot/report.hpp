#pragma once

#include <depot/lockfile.hpp>
#include <depot/resolver.hpp>
#include <string>
#include <vector>

namespace depot {

// What a presentation layer needs to describe one resolved package
struct ReportEntry {
    std::string name;            // PackageIdentity
    std::string app;             // alias as declared
    std::string registry_name;
    std::string version;
    std::string source_kind;     // "registry" or "path"
    std::string path;            // path sources only
    bool locked = false;         // previous lock held this version and source
    std::string locked_version;  // previous lock's version, empty if unlocked
};

// One entry per resolved package, sorted by name
std::vector<ReportEntry> build_report(const Resolution& resolution,
                                      const LockFile& previous);

} // namespace depot
