#include <depot/resolver.hpp>
#include <depot/log.hpp>
#include <depot/name.hpp>
#include <depot/override.hpp>

#include <algorithm>
#include <deque>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace depot {

namespace {

struct Selection {
    Version version;
    DependencySource source;
    std::string registry_name;
    bool from_lock = false;
};

// One decision point. Each candidate gets its own copy, so undoing a
// tentative selection is dropping the copy.
struct SearchState {
    std::vector<Requirement> requirements;  // collected, before overrides
    std::vector<std::string> order;         // selected identities
    std::unordered_map<std::string, Selection> selected;
    std::unordered_set<std::string> retracted;  // "identity source" pairs
};

struct Candidate {
    Version version;
    bool from_lock = false;
    bool loaded = false;  // requirements already known (path sources)
    std::vector<Requirement> requirements;
};

using Group = std::vector<const Requirement*>;

// Shortest requestor path from the root to every selected package
struct Ancestry {
    std::unordered_map<std::string, std::string> parent;
    std::unordered_map<std::string, int> depth;
};

Ancestry trace_ancestry(const SearchState& state) {
    Ancestry anc;
    anc.depth[ROOT_REQUESTOR] = 0;

    std::deque<std::string> queue{ROOT_REQUESTOR};
    while (!queue.empty()) {
        std::string cur = queue.front();
        queue.pop_front();
        for (const auto& req : state.requirements) {
            if (req.requestor != cur) continue;
            if (!state.selected.count(req.package)) continue;
            if (anc.depth.count(req.package)) continue;
            anc.depth[req.package] = anc.depth[cur] + 1;
            anc.parent[req.package] = cur;
            queue.push_back(req.package);
        }
    }
    return anc;
}

std::string label(const SearchState& state, const std::string& name) {
    auto it = state.selected.find(name);
    if (name == ROOT_REQUESTOR || it == state.selected.end()) return name;
    return name + " " + it->second.version.to_string();
}

// "root -> ecto 0.2.0 -> postgrex 0.2.1 requires ex_doc ~> 0.1.0"
std::string requestor_chain(const SearchState& state, const Ancestry& anc,
                            const Requirement& req) {
    std::vector<std::string> hops;
    std::unordered_set<std::string> seen;
    std::string cur = req.requestor;
    while (seen.insert(cur).second) {
        hops.push_back(label(state, cur));
        auto it = anc.parent.find(cur);
        if (it == anc.parent.end()) break;
        cur = it->second;
    }

    std::string chain;
    for (auto it = hops.rbegin(); it != hops.rend(); ++it) {
        if (!chain.empty()) chain += " -> ";
        chain += *it;
    }
    return chain + " requires " + req.describe();
}

std::vector<std::string> requestor_chains(const SearchState& state,
                                          const Ancestry& anc,
                                          const Group& group) {
    std::vector<std::string> chains;
    for (const auto* req : group) {
        chains.push_back(requestor_chain(state, anc, *req));
    }
    return chains;
}

std::string join_versions(const std::vector<Version>& versions) {
    std::string s;
    for (const auto& v : versions) {
        if (!s.empty()) s += ", ";
        s += v.to_string();
    }
    return s;
}

class Search {
public:
    Search(Registry& registry, PathSource& paths, const LockFile& lock,
           const ResolveOptions& options, std::unordered_set<std::string> unlocked)
        : registry_(registry), paths_(paths), lock_(lock), options_(options),
          unlocked_(std::move(unlocked)) {}

    Result<SearchState> step(const SearchState& state);
    Result<Resolution> finish(const SearchState& state);

private:
    Registry& registry_;
    PathSource& paths_;
    const LockFile& lock_;
    const ResolveOptions& options_;
    std::unordered_set<std::string> unlocked_;
    size_t decisions_ = 0;

    Status check_names(const SearchState& state, const Ancestry& anc,
                       const std::vector<std::string>& identities,
                       const std::unordered_map<std::string, Group>& groups,
                       const std::unordered_set<std::string>& needed);
    Status check_selected(const SearchState& state, const Ancestry& anc,
                          const std::unordered_map<std::string, Group>& groups);
    Result<std::optional<SearchState>> supersede(
        const SearchState& state, const std::unordered_map<std::string, Group>& groups);

    Result<std::vector<Candidate>> path_candidates(
        const SearchState& state, const Ancestry& anc,
        const std::string& identity, const Group& group);
    Result<std::vector<Candidate>> registry_candidates(
        const SearchState& state, const Ancestry& anc,
        const std::string& identity, const Group& group);

    Result<std::vector<Requirement>> release_requirements(
        const std::string& identity, const std::string& registry_name,
        const Version& version);

    const LockEntry* lock_hint(const std::string& identity,
                               const std::string& registry_name) const;
};

// ---------------------------------------------------------------------------
// Consistency checks
// ---------------------------------------------------------------------------

Status Search::check_names(const SearchState& state, const Ancestry& anc,
                           const std::vector<std::string>& identities,
                           const std::unordered_map<std::string, Group>& groups,
                           const std::unordered_set<std::string>& needed) {
    for (const auto& identity : identities) {
        if (!needed.count(identity) && !state.selected.count(identity)) continue;

        const Group& group = groups.at(identity);
        const Requirement* first = nullptr;
        for (const auto* req : group) {
            if (req->is_path()) continue;
            if (!first) {
                first = req;
            } else if (req->registry_name != first->registry_name) {
                return DepotError(DepotError::NameConflict,
                    "'" + identity + "' is required as registry package '" +
                    first->registry_name + "' and as '" + req->registry_name + "'",
                    "make every declaration of '" + identity +
                    "' use the same 'package', or add an override")
                    .with_requestors(requestor_chains(state, anc, group));
            }
        }
    }
    return ok_status();
}

Status Search::check_selected(const SearchState& state, const Ancestry& anc,
                              const std::unordered_map<std::string, Group>& groups) {
    for (const auto& identity : state.order) {
        auto it = groups.find(identity);
        if (it == groups.end()) continue;

        const Selection& sel = state.selected.at(identity);
        for (const auto* req : it->second) {
            bool same_source = req->source == sel.source;
            bool same_name = req->is_path() || req->registry_name == sel.registry_name;
            if (same_source && same_name && req->constraint.matches(sel.version)) {
                continue;
            }
            return DepotError(DepotError::Unsatisfiable,
                "version conflict on '" + identity + "': " + label(state, identity) +
                " was selected, but " + req->describe() + " is required")
                .with_requestors(requestor_chains(state, anc, it->second));
        }
    }
    return ok_status();
}

// Drops `identity` from the state with every requirement it contributed,
// then every selection no longer required by anything.
Result<SearchState> retract(SearchState state, const std::string& identity) {
    std::vector<std::string> dropping{identity};
    while (!dropping.empty()) {
        for (const auto& name : dropping) {
            state.selected.erase(name);
            state.order.erase(std::remove(state.order.begin(), state.order.end(), name),
                              state.order.end());
            state.requirements.erase(
                std::remove_if(state.requirements.begin(), state.requirements.end(),
                               [&](const Requirement& r) { return r.requestor == name; }),
                state.requirements.end());
        }
        dropping.clear();

        auto effective = apply_overrides(state.requirements);
        if (effective.is_err()) return std::move(effective).error();
        auto needed = mandatory_identities(effective.value());
        for (const auto& name : state.order) {
            if (!needed.count(name)) dropping.push_back(name);
        }
    }
    return Result<SearchState>::ok(std::move(state));
}

// An override that arrives after its identity was decided replaces that
// decision instead of conflicting with it.
Result<std::optional<SearchState>> Search::supersede(
    const SearchState& state, const std::unordered_map<std::string, Group>& groups)
{
    for (const auto& identity : state.order) {
        auto it = groups.find(identity);
        if (it == groups.end() || !it->second.front()->override) continue;

        const Requirement& ovr = *it->second.front();
        const Selection& sel = state.selected.at(identity);
        bool same_name = ovr.is_path() || ovr.registry_name == sel.registry_name;
        if (ovr.source == sel.source && same_name && ovr.constraint.matches(sel.version)) {
            continue;
        }

        std::string key = identity + " " + sel.source.to_string();
        if (state.retracted.count(key)) {
            return DepotError(DepotError::ConflictingOverride,
                "override on '" + identity + "' from " + ovr.requestor +
                " keeps replacing " + label(state, identity) + " (" +
                sel.source.to_string() + ")",
                "a package overrides the dependency that requires it");
        }

        log::debug("%s replaces selected %s", ovr.describe().c_str(),
                   label(state, identity).c_str());
        auto next = retract(state, identity);
        if (next.is_err()) return std::move(next).error();
        next.value().retracted.insert(std::move(key));
        return Result<std::optional<SearchState>>::ok(std::move(next).value());
    }
    return Result<std::optional<SearchState>>::ok(std::nullopt);
}

// ---------------------------------------------------------------------------
// Candidates
// ---------------------------------------------------------------------------

Result<std::vector<Candidate>> Search::path_candidates(
    const SearchState& state, const Ancestry& anc,
    const std::string& identity, const Group& group)
{
    const Requirement& req = *group.front();
    const std::string& dir = req.source.path;

    auto manifest = paths_.read_manifest(dir);
    if (manifest.is_err()) {
        auto err = std::move(manifest).error();
        err.message = "cannot read path dependency '" + identity + "': " + err.message;
        return err.with_requestors(requestor_chains(state, anc, group));
    }
    const Manifest& m = manifest.value();
    std::string manifest_file = dir + "/" + MANIFEST_FILE;

    if (m.package.version.empty()) {
        return DepotError(DepotError::InvalidManifest,
            "path dependency '" + identity + "' has no [package] version",
            "", manifest_file, 0);
    }
    auto version = Version::parse(m.package.version);
    if (version.is_err()) {
        return DepotError(DepotError::InvalidManifest,
            "path dependency '" + identity + "': " + version.error().message,
            "", manifest_file, 0);
    }

    if (!m.package.name.empty()) {
        auto declared = package_identity(m.package.name);
        if (declared.is_ok() && declared.value() != identity) {
            log::warn("path dependency '%s' at %s declares package '%s'",
                      identity.c_str(), dir.c_str(), m.package.name.c_str());
        }
    }

    if (!req.constraint.matches(version.value())) {
        return DepotError(DepotError::Unsatisfiable,
            "path dependency '" + identity + "' at " + dir + " has version " +
            version.value().to_string() + ", which does not satisfy " +
            req.constraint_text)
            .with_requestors(requestor_chains(state, anc, group));
    }

    auto reqs = normalize_all(m.dependencies, identity, dir);
    if (reqs.is_err()) {
        auto err = std::move(reqs).error();
        if (err.file.empty()) err.file = manifest_file;
        return err;
    }

    Candidate cand;
    cand.version = std::move(version).value();
    cand.loaded = true;
    cand.requirements = std::move(reqs).value();

    std::vector<Candidate> out;
    out.push_back(std::move(cand));
    return Result<std::vector<Candidate>>::ok(std::move(out));
}

const LockEntry* Search::lock_hint(const std::string& identity,
                                   const std::string& registry_name) const {
    if (options_.update_all || unlocked_.count(identity)) return nullptr;
    const LockEntry* entry = lock_.find(identity);
    if (!entry || entry->is_path()) return nullptr;
    if (entry->registry_name != registry_name) return nullptr;
    return entry;
}

Result<std::vector<Candidate>> Search::registry_candidates(
    const SearchState& state, const Ancestry& anc,
    const std::string& identity, const Group& group)
{
    const std::string& registry_name = group.front()->registry_name;

    auto versions = registry_.versions(registry_name);
    if (versions.failed_with(DepotError::NotFound)) {
        return DepotError(DepotError::Unsatisfiable,
            "package '" + registry_name + "' does not exist in the registry")
            .with_requestors(requestor_chains(state, anc, group));
    }
    if (versions.is_err()) return std::move(versions).error();

    std::vector<Version> matching;
    for (const auto& v : versions.value()) {
        bool ok = std::all_of(group.begin(), group.end(),
            [&](const Requirement* r) { return r->constraint.matches(v); });
        if (ok) matching.push_back(v);
    }

    if (matching.empty()) {
        return DepotError(DepotError::Unsatisfiable,
            "no version of '" + registry_name + "' satisfies every requirement",
            "available versions: " + join_versions(versions.value()))
            .with_requestors(requestor_chains(state, anc, group));
    }

    std::sort(matching.begin(), matching.end(),
              [](const Version& a, const Version& b) { return a > b; });

    std::vector<Candidate> out;
    const LockEntry* locked = lock_hint(identity, registry_name);
    if (locked) {
        auto lv = Version::parse(locked->version);
        auto it = lv.is_ok()
            ? std::find(matching.begin(), matching.end(), lv.value())
            : matching.end();
        if (it != matching.end()) {
            Candidate cand;
            cand.version = *it;
            cand.from_lock = true;
            out.push_back(std::move(cand));
            matching.erase(it);
        } else {
            log::debug("locked %s %s no longer satisfies its requirements",
                       identity.c_str(), locked->version.c_str());
        }
    }

    for (auto& v : matching) {
        Candidate cand;
        cand.version = std::move(v);
        out.push_back(std::move(cand));
    }
    return Result<std::vector<Candidate>>::ok(std::move(out));
}

Result<std::vector<Requirement>> Search::release_requirements(
    const std::string& identity, const std::string& registry_name,
    const Version& version)
{
    std::string release = registry_name + " " + version.to_string();

    auto raws = registry_.requirements(registry_name, version);
    if (raws.failed_with(DepotError::NotFound)) {
        return DepotError(DepotError::Unsatisfiable,
            "registry has no metadata for " + release);
    }
    if (raws.is_err()) return std::move(raws).error();

    for (const auto& raw : raws.value()) {
        if (raw.path || raw.override) {
            return DepotError(DepotError::MalformedMetadata,
                "release " + release + " declares '" + raw.name +
                "' with a path or an override");
        }
    }

    auto reqs = normalize_all(raws.value(), identity);
    if (reqs.is_err()) {
        return DepotError(DepotError::MalformedMetadata,
            "release " + release + ": " + reqs.error().message);
    }
    return reqs;
}

// ---------------------------------------------------------------------------
// Search step
// ---------------------------------------------------------------------------

Result<SearchState> Search::step(const SearchState& state) {
    if (options_.cancel && options_.cancel->load()) {
        return DepotError(DepotError::Cancelled,
            "resolution cancelled after " + std::to_string(decisions_) + " decisions");
    }

    auto effective = apply_overrides(state.requirements);
    if (effective.is_err()) return std::move(effective).error();

    std::vector<std::string> identities;
    std::unordered_map<std::string, Group> groups;
    for (const auto& req : effective.value()) {
        auto& group = groups[req.package];
        if (group.empty()) identities.push_back(req.package);
        group.push_back(&req);
    }

    auto needed = mandatory_identities(effective.value());
    Ancestry anc = trace_ancestry(state);

    DEPOT_TRY(check_names(state, anc, identities, groups, needed));

    auto superseded = supersede(state, groups);
    if (superseded.is_err()) return std::move(superseded).error();
    if (superseded.value()) return step(*superseded.value());

    DEPOT_TRY(check_selected(state, anc, groups));

    // Path sources first, then first-declared order
    std::optional<std::string> next;
    for (int pass = 0; pass < 2 && !next; ++pass) {
        for (const auto& identity : identities) {
            if (state.selected.count(identity) || !needed.count(identity)) continue;
            bool is_path = groups[identity].front()->is_path();
            if (pass == 0 && !is_path) continue;
            next = identity;
            break;
        }
    }
    if (!next) return Result<SearchState>::ok(state);

    const std::string& identity = *next;
    const Group& group = groups[identity];
    bool is_path = group.front()->is_path();

    auto candidates = is_path
        ? path_candidates(state, anc, identity, group)
        : registry_candidates(state, anc, identity, group);
    if (candidates.is_err()) return std::move(candidates).error();

    std::optional<DepotError> first_conflict;
    for (auto& cand : candidates.value()) {
        ++decisions_;
        if (!cand.loaded) {
            auto reqs = release_requirements(identity, group.front()->registry_name,
                                             cand.version);
            if (reqs.failed_with(DepotError::Unsatisfiable)) {
                log::warn("%s", reqs.error().message.c_str());
                if (!first_conflict) first_conflict = std::move(reqs).error();
                continue;
            }
            if (reqs.is_err()) return std::move(reqs).error();
            cand.requirements = std::move(reqs).value();
        }

        log::debug("trying %s %s%s", identity.c_str(),
                   cand.version.to_string().c_str(),
                   cand.from_lock ? " (locked)" : is_path ? " (path)" : "");

        SearchState next_state = state;
        next_state.order.push_back(identity);
        Selection sel;
        sel.version = cand.version;
        sel.source = group.front()->source;
        sel.registry_name = group.front()->registry_name;
        sel.from_lock = cand.from_lock;
        next_state.selected[identity] = std::move(sel);
        next_state.requirements.insert(next_state.requirements.end(),
            cand.requirements.begin(), cand.requirements.end());

        auto r = step(next_state);
        if (r.is_ok() || !r.failed_with(DepotError::Unsatisfiable)) return r;

        log::trace("backtracking from %s %s: %s", identity.c_str(),
                   cand.version.to_string().c_str(), r.error().message.c_str());
        if (!first_conflict) first_conflict = std::move(r).error();
    }

    return *first_conflict;
}

// ---------------------------------------------------------------------------
// Result assembly
// ---------------------------------------------------------------------------

Result<Resolution> Search::finish(const SearchState& state) {
    Ancestry anc = trace_ancestry(state);

    auto effective = apply_overrides(state.requirements);
    if (effective.is_err()) return std::move(effective).error();
    std::unordered_set<std::string> skipped;
    for (const auto& req : effective.value()) {
        if (!state.selected.count(req.package) && skipped.insert(req.package).second) {
            log::debug("skipping optional dependency %s", req.package.c_str());
        }
    }

    auto requires_of = [&](const std::string& requestor) {
        std::vector<std::string> deps;
        for (const auto& req : state.requirements) {
            if (req.requestor != requestor || !state.selected.count(req.package)) continue;
            if (std::find(deps.begin(), deps.end(), req.package) == deps.end()) {
                deps.push_back(req.package);
            }
        }
        return deps;
    };

    Resolution res;
    res.root_dependencies = requires_of(ROOT_REQUESTOR);

    for (const auto& identity : state.order) {
        const Selection& sel = state.selected.at(identity);

        ResolvedPackage pkg;
        pkg.name = identity;
        pkg.registry_name = sel.registry_name;
        pkg.version = sel.version;
        pkg.source = sel.source;
        pkg.from_lock = sel.from_lock;
        pkg.parent = anc.parent[identity];
        pkg.depth = anc.depth[identity];
        pkg.app = identity;
        for (const auto& req : state.requirements) {
            if (req.requestor == pkg.parent && req.package == identity) {
                pkg.app = req.app;
                break;
            }
        }

        if (!sel.source.is_path()) {
            auto sum = registry_.checksum(sel.registry_name, sel.version);
            if (sum.is_err()) return std::move(sum).error();
            pkg.checksum = std::move(sum).value();
        }

        pkg.dependencies = requires_of(identity);
        std::sort(pkg.dependencies.begin(), pkg.dependencies.end());

        log::debug("selected %s %s", identity.c_str(), sel.version.to_string().c_str());
        res.packages.push_back(std::move(pkg));
    }

    return Result<Resolution>::ok(std::move(res));
}

} // namespace

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

const ResolvedPackage* Resolution::find(const std::string& name) const {
    for (const auto& pkg : packages) {
        if (pkg.name == name) return &pkg;
    }
    return nullptr;
}

LockFile Resolution::to_lock() const {
    LockFile lock;
    for (const auto& pkg : packages) {
        LockEntry entry;
        entry.name = pkg.name;
        entry.registry_name = pkg.registry_name;
        entry.source = pkg.source.to_string();
        entry.version = pkg.version.to_string();
        entry.checksum = pkg.checksum;
        entry.dependencies = pkg.dependencies;
        lock.packages.push_back(std::move(entry));
    }
    std::sort(lock.packages.begin(), lock.packages.end(),
              [](const LockEntry& a, const LockEntry& b) { return a.name < b.name; });
    return lock;
}

GraphMap<> Resolution::dependency_graph() const {
    GraphMap<> g;
    for (const auto& pkg : packages) {
        g.add_node(pkg.name);
    }
    for (const auto& pkg : packages) {
        for (const auto& dep : pkg.dependencies) {
            g.add_edge(pkg.name, dep);
        }
    }
    return g;
}

Result<std::vector<std::string>> Resolution::install_order() const {
    auto sorted = dependency_graph().topological_sort();
    if (sorted.is_err()) return std::move(sorted).error();

    std::vector<std::string> order = std::move(sorted).value();
    std::reverse(order.begin(), order.end());
    return Result<std::vector<std::string>>::ok(std::move(order));
}

std::string Resolution::tree() const {
    GraphMap<> g;
    g.add_node(ROOT_REQUESTOR);
    for (const auto& dep : root_dependencies) {
        g.add_edge(ROOT_REQUESTOR, dep);
    }
    for (const auto& pkg : packages) {
        for (const auto& dep : pkg.dependencies) {
            g.add_edge(pkg.name, dep);
        }
    }

    return g.tree_display(ROOT_REQUESTOR, [this](const std::string& name) {
        const ResolvedPackage* pkg = find(name);
        if (!pkg) return name;
        std::string s = name + " " + pkg->version.to_string();
        if (pkg->source.is_path()) s += " (path)";
        return s;
    });
}

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(Registry& registry, PathSource& paths)
    : registry_(registry), paths_(paths) {}

Result<Resolution> Resolver::resolve(const std::vector<Requirement>& root,
                                     const LockFile& lock,
                                     const ResolveOptions& options)
{
    std::unordered_set<std::string> unlocked;
    for (const auto& name : options.update) {
        auto identity = package_identity(name);
        if (identity.is_err()) {
            return DepotError(DepotError::InvalidArg,
                "cannot update '" + name + "': " + identity.error().message);
        }
        if (!lock.find(identity.value())) {
            log::warn("'%s' is not locked, nothing to update", name.c_str());
        }
        unlocked.insert(std::move(identity).value());
    }

    for (const auto& req : root) {
        if (req.requestor != ROOT_REQUESTOR) {
            return DepotError(DepotError::InvalidArg,
                "root requirement on '" + req.package + "' has requestor '" +
                req.requestor + "'");
        }
    }

    // Lookups repeat while backtracking; answer them from one cache per run
    CachingRegistry registry(registry_);
    Search search(registry, paths_, lock, options, std::move(unlocked));

    SearchState initial;
    initial.requirements = root;

    auto final_state = search.step(initial);
    if (final_state.is_err()) return std::move(final_state).error();

    auto res = search.finish(final_state.value());
    if (res.is_ok()) {
        log::debug("resolved %zu packages with %zu registry lookups",
                   res.value().packages.size(), registry.inner_calls());
    }
    return res;
}

} // namespace depot
