#include <depot/project.hpp>
#include <depot/local_override.hpp>
#include <depot/log.hpp>
#include <depot/path_source.hpp>
#include <algorithm>
#include <unordered_set>

namespace depot {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Result<fs::path> find_manifest(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return DepotError{DepotError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / MANIFEST_FILE;
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return DepotError{DepotError::NotFound,
                "no " + MANIFEST_FILE + " found in " + start_dir.string() +
                " or any parent directory"};
        }
        dir = parent;
    }
}

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / MANIFEST_FILE, ec);
}

// ---------------------------------------------------------------------------
// Project
// ---------------------------------------------------------------------------

Result<Project> Project::load(const fs::path& project_dir) {
    std::error_code ec;
    fs::path abs_root = fs::canonical(project_dir, ec);
    if (ec) abs_root = fs::absolute(project_dir);

    fs::path abs_manifest = abs_root / MANIFEST_FILE;
    if (!fs::exists(abs_manifest, ec)) {
        return DepotError{DepotError::NotFound,
            "no " + MANIFEST_FILE + " in: " + abs_root.string()};
    }

    auto manifest = Manifest::load(abs_manifest.string());
    if (manifest.is_err()) return std::move(manifest).error();

    Project proj;
    proj.manifest = std::move(manifest).value();
    proj.root_dir = abs_root;
    proj.manifest_path = abs_manifest;

    return Result<Project>::ok(std::move(proj));
}

Result<Project> Project::discover(const fs::path& start_dir) {
    auto manifest_path = find_manifest(start_dir);
    if (manifest_path.is_err()) return std::move(manifest_path).error();

    return Project::load(manifest_path.value().parent_path());
}

fs::path Project::lock_path() const {
    return root_dir / LOCK_FILE;
}

Result<std::vector<Requirement>> Project::root_requirements(bool no_local) const {
    auto reqs = normalize_all(manifest.dependencies, ROOT_REQUESTOR, root_dir);
    if (reqs.is_err()) {
        auto err = std::move(reqs).error();
        if (err.file.empty()) err.file = manifest_path.string();
        return err;
    }
    std::vector<Requirement> out = std::move(reqs).value();

    if (should_suppress_overrides(no_local)) {
        return Result<std::vector<Requirement>>::ok(std::move(out));
    }

    auto local = discover_local_overrides(root_dir);
    if (local.is_err()) return std::move(local).error();
    if (local.value().empty()) {
        return Result<std::vector<Requirement>>::ok(std::move(out));
    }

    DEPOT_TRY(local.value().validate(root_dir));
    local.value().warn_active();

    auto local_reqs = local.value().to_requirements(root_dir);
    if (local_reqs.is_err()) return std::move(local_reqs).error();

    std::unordered_set<std::string> replaced;
    for (const auto& req : local_reqs.value()) replaced.insert(req.package);

    out.erase(std::remove_if(out.begin(), out.end(),
        [&](const Requirement& req) {
            return req.override && replaced.count(req.package);
        }), out.end());
    out.insert(out.end(), local_reqs.value().begin(), local_reqs.value().end());

    return Result<std::vector<Requirement>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// lock_project
// ---------------------------------------------------------------------------

Result<LockOutcome> lock_project(const Project& project, Registry& registry,
                                 const ResolveOptions& options) {
    FsPathSource paths;
    return lock_project(project, registry, paths, options);
}

Result<LockOutcome> lock_project(const Project& project, Registry& registry,
                                 PathSource& paths,
                                 const ResolveOptions& options) {
    LockStore store(project.lock_path().string());

    auto previous = store.read();
    if (previous.is_err()) {
        // A broken lock only loses its hints; the run rewrites it
        log::warn("ignoring unreadable lock: %s", previous.error().format().c_str());
        previous = Result<LockFile>::ok(LockFile{});
    }

    auto root = project.root_requirements(options.no_local);
    if (root.is_err()) return std::move(root).error();

    Resolver resolver(registry, paths);
    auto resolution = resolver.resolve(root.value(), previous.value(), options);
    if (resolution.is_err()) return std::move(resolution).error();

    auto written = store.write(resolution.value().to_lock());
    if (written.is_err()) return std::move(written).error();

    LockOutcome outcome;
    outcome.resolution = std::move(resolution).value();
    outcome.previous = std::move(previous).value();
    outcome.lock_written = written.value();
    return Result<LockOutcome>::ok(std::move(outcome));
}

} // namespace depot
