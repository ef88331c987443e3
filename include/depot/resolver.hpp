#pragma once

#include <depot/result.hpp>
#include <depot/graph.hpp>
#include <depot/lockfile.hpp>
#include <depot/path_source.hpp>
#include <depot/registry.hpp>
#include <depot/requirement.hpp>

#include <atomic>
#include <string>
#include <vector>

namespace depot {

struct ResolveOptions {
    bool no_local = false;             // Suppress Depot.local overrides
    bool update_all = false;           // Ignore every lock entry
    std::vector<std::string> update;   // Packages whose lock entries are ignored
    // Checked between decision steps; once set the run fails with Cancelled
    const std::atomic<bool>* cancel = nullptr;
};

// One selected package
struct ResolvedPackage {
    std::string name;             // PackageIdentity
    std::string app;              // alias declared closest to the root
    std::string registry_name;
    Version version;
    DependencySource source;
    std::string checksum;         // registry checksum (empty for path sources)
    std::vector<std::string> dependencies;  // selected identities it requires, sorted
    std::string parent;           // requestor closest to the root
    int depth = 1;                // 1 for packages the root requires
    bool from_lock = false;       // version taken from the lock hint
};

struct Resolution {
    std::vector<ResolvedPackage> packages;  // decision order
    std::vector<std::string> root_dependencies;

    const ResolvedPackage* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    LockFile to_lock() const;

    // Edge a -> b when selected package a requires selected package b
    GraphMap<> dependency_graph() const;

    // Dependencies before their dependents; Cycle when packages require
    // each other
    Result<std::vector<std::string>> install_order() const;

    // "root" followed by an indented tree of "name version" lines
    std::string tree() const;
};

// Backtracking search for one version per PackageIdentity.
// Only Unsatisfiable failures are retried with another candidate; every
// other error aborts the run.
class Resolver {
public:
    Resolver(Registry& registry, PathSource& paths);

    Result<Resolution> resolve(const std::vector<Requirement>& root,
                               const LockFile& lock,
                               const ResolveOptions& options = {});

private:
    Registry& registry_;
    PathSource& paths_;
};

} // namespace depot
