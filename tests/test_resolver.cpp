#include <catch2/catch.hpp>
#include <depot/registry_index.hpp>
#include <depot/resolver.hpp>
#include "temp_dir.hpp"

#include <algorithm>

using namespace depot;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static RegistryIndex fixture_index() {
    RegistryIndex index;
    REQUIRE(index.open(":memory:").is_ok());
    REQUIRE(index.import_file(fixture_dir() + "/registry.toml").is_ok());
    return index;
}

static RegistryIndex index_from(const std::string& snapshot) {
    RegistryIndex index;
    REQUIRE(index.open(":memory:").is_ok());
    REQUIRE(index.import_snapshot(snapshot).is_ok());
    return index;
}

static Requirement root_dep(const std::string& name, const std::string& constraint,
                            bool optional = false, bool override = false) {
    RawRequirement raw;
    raw.name = name;
    raw.requirement = constraint;
    raw.optional = optional;
    raw.override = override;
    return normalize(raw, ROOT_REQUESTOR).value();
}

static Requirement root_path(const std::string& name, const fs::path& dir,
                             bool override = false) {
    RawRequirement raw;
    raw.name = name;
    raw.path = dir.generic_string();
    raw.override = override;
    return normalize(raw, ROOT_REQUESTOR).value();
}

static std::string version_of(const Resolution& res, const std::string& name) {
    const ResolvedPackage* pkg = res.find(name);
    return pkg ? pkg->version.to_string() : "";
}

// Remembers every package name the resolver asked about
class RecordingRegistry : public Registry {
public:
    explicit RecordingRegistry(Registry& inner) : inner_(inner) {}

    Result<std::vector<Version>> versions(const std::string& name) override {
        looked_up.push_back(name);
        return inner_.versions(name);
    }
    Result<std::vector<RawRequirement>> requirements(
        const std::string& name, const Version& version) override {
        looked_up.push_back(name);
        return inner_.requirements(name, version);
    }
    Result<std::string> checksum(const std::string& name,
                                 const Version& version) override {
        looked_up.push_back(name);
        return inner_.checksum(name, version);
    }

    bool asked_about(const std::string& name) const {
        return std::find(looked_up.begin(), looked_up.end(), name) != looked_up.end();
    }

    std::vector<std::string> looked_up;

private:
    Registry& inner_;
};

// Fails lookups of selected packages the way a broken registry would
class FaultyRegistry : public Registry {
public:
    explicit FaultyRegistry(Registry& inner) : inner_(inner) {}

    std::string offline;   // versions() fails with Network
    std::string tampered;  // requirements() declare a path dependency

    Result<std::vector<Version>> versions(const std::string& name) override {
        if (name == offline) {
            return DepotError{DepotError::Network, "connection reset fetching " + name};
        }
        return inner_.versions(name);
    }
    Result<std::vector<RawRequirement>> requirements(
        const std::string& name, const Version& version) override {
        if (name == tampered) {
            RawRequirement raw;
            raw.name = "ex_doc";
            raw.path = "/etc";
            return Result<std::vector<RawRequirement>>::ok({raw});
        }
        return inner_.requirements(name, version);
    }
    Result<std::string> checksum(const std::string& name,
                                 const Version& version) override {
        return inner_.checksum(name, version);
    }

private:
    Registry& inner_;
};

static void write_package(TempDir& tmp, const std::string& dir, const std::string& name,
                          const std::string& version, const std::string& deps = "") {
    std::string manifest = "[package]\nname = \"" + name + "\"\n";
    if (!version.empty()) manifest += "version = \"" + version + "\"\n";
    if (!deps.empty()) manifest += "\n[dependencies]\n" + deps;
    tmp.write_file(dir + "/Depot.toml", manifest);
}

// ===== Basic selection =====

TEST_CASE("newest satisfying version is selected", "[resolver]") {
    auto index = index_from(R"(
[[releases]]
name = "ecto"
version = "0.2.0"
[releases.dependencies]
postgrex = ">= 0.0.0"

[[releases]]
name = "postgrex"
version = "0.2.0"

[[releases]]
name = "postgrex"
version = "0.2.1"
)");
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.size() == 2);
    REQUIRE(version_of(r.value(), "ecto") == "0.2.0");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
}

TEST_CASE("newest versions across the fixture registry", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.1");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
    REQUIRE(version_of(r.value(), "ex_doc") == "0.1.0");
}

TEST_CASE("empty root resolves to nothing", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({}, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.empty());
    REQUIRE(r.value().to_lock().empty());
}

TEST_CASE("backtracking past a conflicting transitive version", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    // postgrex 0.2.1 wants ex_doc ~> 0.1.0, which ecto 0.2.0 rules out
    auto r = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{});
    REQUIRE(r.is_ok());
    auto& res = r.value();
    REQUIRE(res.packages.size() == 3);
    REQUIRE(version_of(res, "ecto") == "0.2.0");
    REQUIRE(version_of(res, "postgrex") == "0.2.0");
    REQUIRE(version_of(res, "ex_doc") == "0.0.1");
}

TEST_CASE("resolved package details", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto res = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{}).value();

    REQUIRE(res.root_dependencies == std::vector<std::string>{"ecto"});

    const ResolvedPackage* ecto = res.find("ecto");
    REQUIRE(ecto != nullptr);
    REQUIRE(ecto->parent == "root");
    REQUIRE(ecto->depth == 1);
    REQUIRE(ecto->registry_name == "ecto");
    REQUIRE(ecto->checksum ==
            "2a4b7d9c1e0f3a5b6c7d8e9f0a1b2c3d4e5f6a7b8c9d0e1f2a3b4c5d6e7f8a9b");
    REQUIRE(ecto->dependencies == std::vector<std::string>{"ex_doc", "postgrex"});
    REQUIRE_FALSE(ecto->from_lock);

    const ResolvedPackage* ex_doc = res.find("ex_doc");
    REQUIRE(ex_doc != nullptr);
    REQUIRE(ex_doc->parent == "ecto");
    REQUIRE(ex_doc->depth == 2);
    REQUIRE(ex_doc->checksum == std::string(64, '1'));
    REQUIRE(ex_doc->dependencies.empty());

    REQUIRE_FALSE(res.contains("phoenix"));
}

// ===== Overrides =====

TEST_CASE("root override replaces a transitive requirement", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("ecto", "0.2.0"),
        root_dep("ex_doc", "~> 0.1.0", false, true),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ex_doc") == "0.1.0");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
}

TEST_CASE("path override skips the registry", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "ex_doc", "ex_doc", "0.1.0");

    auto index = fixture_index();
    RecordingRegistry recording(index);
    FsPathSource paths;
    Resolver resolver(recording, paths);

    auto r = resolver.resolve({
        root_dep("postgrex", ">= 0.0.0"),
        root_path("ex_doc", tmp.path / "ex_doc", true),
    }, LockFile{});
    REQUIRE(r.is_ok());

    const ResolvedPackage* ex_doc = r.value().find("ex_doc");
    REQUIRE(ex_doc != nullptr);
    REQUIRE(ex_doc->source.is_path());
    REQUIRE(ex_doc->source.path == (tmp.path / "ex_doc").generic_string());
    REQUIRE(ex_doc->version.to_string() == "0.1.0");
    REQUIRE(ex_doc->checksum.empty());

    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
    REQUIRE(recording.asked_about("postgrex"));
    REQUIRE_FALSE(recording.asked_about("ex_doc"));
}

TEST_CASE("override declared by a path package applies everywhere", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "tools", "tools", "1.0.0",
                  "ex_doc = { version = \"0.0.1\", override = true }\n");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_path("tools", tmp.path / "tools"),
        root_dep("ecto", ">= 0.0.0"),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.1");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
    REQUIRE(version_of(r.value(), "ex_doc") == "0.0.1");
}

TEST_CASE("path override from a sibling wins in either order", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "ex_doc1", "ex_doc", "0.1.0");
    write_package(tmp, "ex_doc2", "ex_doc", "0.2.0");
    write_package(tmp, "tools", "tools", "1.0.0",
                  "ex_doc = { path = \"../ex_doc2\", override = true }\n");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto tools = root_path("tools", tmp.path / "tools");
    auto ex_doc = root_path("ex_doc", tmp.path / "ex_doc1");

    for (const auto& root : {std::vector<Requirement>{tools, ex_doc},
                             std::vector<Requirement>{ex_doc, tools}}) {
        auto r = resolver.resolve(root, LockFile{});
        REQUIRE(r.is_ok());
        const ResolvedPackage* pkg = r.value().find("ex_doc");
        REQUIRE(pkg != nullptr);
        REQUIRE(pkg->source.path == (tmp.path / "ex_doc2").generic_string());
        REQUIRE(pkg->version.to_string() == "0.2.0");
        REQUIRE(r.value().packages.size() == 2);
    }
}

TEST_CASE("replaced selection drops what it required", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "ex_doc1", "ex_doc", "0.1.0",
                  "helper = { path = \"../helper\" }\n");
    write_package(tmp, "ex_doc2", "ex_doc", "0.2.0");
    write_package(tmp, "helper", "helper", "1.0.0");
    write_package(tmp, "lib", "lib", "1.0.0", "tools = { path = \"../tools\" }\n");
    write_package(tmp, "tools", "tools", "1.0.0",
                  "ex_doc = { path = \"../ex_doc2\", override = true }\n");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_path("ex_doc", tmp.path / "ex_doc1"),
        root_path("lib", tmp.path / "lib"),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ex_doc") == "0.2.0");
    REQUIRE(r.value().find("helper") == nullptr);
    REQUIRE(r.value().packages.size() == 3);
    REQUIRE(r.value().find("ex_doc")->dependencies.empty());
}

TEST_CASE("late registry override replaces the selected version", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "tools", "tools", "1.0.0",
                  "ex_doc = { version = \"0.0.1\", override = true }\n");

    auto index = index_from(R"(
[[releases]]
name = "ex_doc"
version = "0.0.1"

[[releases]]
name = "ex_doc"
version = "0.1.0"

[[releases]]
name = "plugin"
version = "1.0.0"
[releases.dependencies]
tools = ">= 0.0.0"
)");
    FsPathSource paths;
    Resolver resolver(index, paths);

    // tools is only needed once plugin has been selected
    RawRequirement optional_tools;
    optional_tools.name = "tools";
    optional_tools.path = (tmp.path / "tools").generic_string();
    optional_tools.optional = true;

    auto r = resolver.resolve({
        root_dep("ex_doc", ">= 0.0.0"),
        normalize(optional_tools, ROOT_REQUESTOR).value(),
        root_dep("plugin", ">= 0.0.0"),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ex_doc") == "0.0.1");
    REQUIRE(r.value().find("tools")->source.is_path());
    REQUIRE(r.value().packages.size() == 3);
}

TEST_CASE("conflicting overrides abort the run", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("ex_doc", "~> 0.1.0", false, true),
        root_dep("ex_doc", "0.0.1", false, true),
    }, LockFile{});
    REQUIRE(r.failed_with(DepotError::ConflictingOverride));
}

// ===== Path dependencies =====

TEST_CASE("path dependency brings its own requirements", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "libs/mylib", "mylib", "1.0.0", "postgrex = \"~> 0.2.0\"\n");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_path("mylib", tmp.path / "libs/mylib")}, LockFile{});
    REQUIRE(r.is_ok());
    auto& res = r.value();
    REQUIRE(res.packages.size() == 3);
    REQUIRE(res.packages[0].name == "mylib");

    const ResolvedPackage* postgrex = res.find("postgrex");
    REQUIRE(postgrex->version.to_string() == "0.2.1");
    REQUIRE(postgrex->parent == "mylib");
    REQUIRE(postgrex->depth == 2);
    REQUIRE(res.find("ex_doc")->depth == 3);

    auto lock = res.to_lock();
    REQUIRE(lock.find("mylib")->is_path());
    REQUIRE(lock.find("mylib")->checksum.empty());
}

TEST_CASE("path requirement wins over registry requirements", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "ex_doc", "ex_doc", "0.3.0");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("ecto", "0.2.0"),
        root_path("ex_doc", tmp.path / "ex_doc"),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("ex_doc")->source.is_path());
    REQUIRE(version_of(r.value(), "ex_doc") == "0.3.0");
}

TEST_CASE("path dependency version must satisfy its constraint", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "mylib", "mylib", "1.0.0");

    RawRequirement raw;
    raw.name = "mylib";
    raw.path = (tmp.path / "mylib").generic_string();
    raw.requirement = "~> 2.0";

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({normalize(raw, ROOT_REQUESTOR).value()}, LockFile{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Unsatisfiable);
    REQUIRE(r.error().message.find("1.0.0") != std::string::npos);
}

TEST_CASE("missing path dependency", "[resolver]") {
    TempDir tmp;
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_path("mylib", tmp.path / "missing")}, LockFile{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::PathNotFound);
    REQUIRE(r.error().requestors.size() == 1);
}

TEST_CASE("path dependency without a version", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "mylib", "mylib", "");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_path("mylib", tmp.path / "mylib")}, LockFile{});
    REQUIRE(r.failed_with(DepotError::InvalidManifest));
}

// ===== Optional dependencies =====

TEST_CASE("optional dependency is left out", "[resolver]") {
    auto index = fixture_index();
    RecordingRegistry recording(index);
    FsPathSource paths;
    Resolver resolver(recording, paths);

    auto r = resolver.resolve({root_dep("only_doc", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().packages.size() == 1);
    REQUIRE_FALSE(r.value().contains("ex_doc"));
    REQUIRE(r.value().find("only_doc")->dependencies.empty());
    REQUIRE_FALSE(recording.asked_about("ex_doc"));
    REQUIRE(r.value().to_lock().find("ex_doc") == nullptr);
}

TEST_CASE("optional dependency required elsewhere is included", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("only_doc", ">= 0.0.0"),
        root_dep("ex_doc", ">= 0.0.0"),
    }, LockFile{});
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ex_doc") == "0.1.0");
    REQUIRE(r.value().find("only_doc")->dependencies ==
            std::vector<std::string>{"ex_doc"});
    REQUIRE(r.value().to_lock().find("ex_doc") != nullptr);
}

// ===== Published-as names =====

TEST_CASE("dependency published under another name", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_dep("depend_name", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.is_ok());

    const ResolvedPackage* app = r.value().find("app_name");
    REQUIRE(app != nullptr);
    REQUIRE(app->registry_name == "package_name");
    REQUIRE(app->app == "app_name");
    REQUIRE(app->version.to_string() == "0.1.0");
    REQUIRE(app->checksum == std::string(64, '6'));
    REQUIRE(r.value().to_lock().find("app_name")->registry_name == "package_name");
}

TEST_CASE("one identity under two registry names", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("depend_name", ">= 0.0.0"),
        root_dep("app_name", ">= 0.0.0"),
    }, LockFile{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::NameConflict);
    REQUIRE(r.error().requestors.size() == 2);
}

// ===== Failures =====

TEST_CASE("unsatisfiable constraints report every requestor", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({
        root_dep("ecto", "0.2.0"),
        root_dep("ex_doc", "0.1.0"),
    }, LockFile{});
    REQUIRE(r.is_err());
    auto& err = r.error();
    REQUIRE(err.code == DepotError::Unsatisfiable);
    REQUIRE(err.message == "no version of 'ex_doc' satisfies every requirement");
    REQUIRE(err.hint == "available versions: 0.0.1, 0.0.2, 0.1.0");
    REQUIRE(err.requestors.size() == 2);
    REQUIRE(err.requestors[0] == "root requires ex_doc 0.1.0");
    REQUIRE(err.requestors[1] == "root -> ecto 0.2.0 requires ex_doc ~> 0.0.1");
}

TEST_CASE("requestor chain follows the path from the root", "[resolver]") {
    auto index = index_from(R"(
[[releases]]
name = "ecto"
version = "0.2.0"
[releases.dependencies]
postgrex = "0.2.1"

[[releases]]
name = "postgrex"
version = "0.2.1"
[releases.dependencies]
ex_doc = "~> 0.1.0"

[[releases]]
name = "ex_doc"
version = "0.0.1"
)");
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Unsatisfiable);
    REQUIRE(r.error().requestors ==
            std::vector<std::string>{"root -> ecto 0.2.0 -> postgrex 0.2.1 requires ex_doc ~> 0.1.0"});
    REQUIRE(r.error().format().find("required by: root -> ecto 0.2.0") != std::string::npos);
}

TEST_CASE("unknown package is unsatisfiable", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto r = resolver.resolve({root_dep("left_pad", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Unsatisfiable);
    REQUIRE(r.error().message.find("left_pad") != std::string::npos);
    REQUIRE(r.error().requestors ==
            std::vector<std::string>{"root requires left_pad >= 0.0.0"});
}

TEST_CASE("network failure aborts instead of backtracking", "[resolver]") {
    auto index = fixture_index();
    FaultyRegistry faulty(index);
    faulty.offline = "postgrex";
    FsPathSource paths;
    Resolver resolver(faulty, paths);

    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.failed_with(DepotError::Network));
}

TEST_CASE("registry release declaring a path is malformed", "[resolver]") {
    auto index = fixture_index();
    FaultyRegistry faulty(index);
    faulty.tampered = "postgrex";
    FsPathSource paths;
    Resolver resolver(faulty, paths);

    auto r = resolver.resolve({root_dep("postgrex", ">= 0.0.0")}, LockFile{});
    REQUIRE(r.failed_with(DepotError::MalformedMetadata));
}

TEST_CASE("cancelled resolution", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    std::atomic<bool> cancel{true};
    ResolveOptions opts;
    opts.cancel = &cancel;

    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, LockFile{}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Cancelled);
}

TEST_CASE("invalid resolver input", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    Requirement not_root = root_dep("ecto", "0.2.0");
    not_root.requestor = "phoenix";
    REQUIRE(resolver.resolve({not_root}, LockFile{}).failed_with(DepotError::InvalidArg));

    ResolveOptions opts;
    opts.update = {"not a name"};
    REQUIRE(resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{}, opts)
                .failed_with(DepotError::InvalidArg));
}

// ===== Lock hints =====

TEST_CASE("locked version is preferred", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    // Lock from an earlier run that pinned ecto exactly
    auto first = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{});
    REQUIRE(first.is_ok());
    LockFile lock = first.value().to_lock();

    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock);
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.0");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.0");
    REQUIRE(version_of(r.value(), "ex_doc") == "0.0.1");
    REQUIRE(r.value().find("ecto")->from_lock);
    REQUIRE(r.value().find("ex_doc")->from_lock);
    REQUIRE(r.value().to_lock() == lock);
}

TEST_CASE("lock stays put when newer releases appear", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto first = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, LockFile{});
    REQUIRE(first.is_ok());
    LockFile lock = first.value().to_lock();

    Release newer;
    newer.name = "ex_doc";
    newer.version = Version::parse("0.1.1").value();
    newer.checksum = std::string(64, '8');
    REQUIRE(index.add_release(newer).is_ok());

    auto again = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock);
    REQUIRE(again.is_ok());
    REQUIRE(version_of(again.value(), "ex_doc") == "0.1.0");
    REQUIRE(again.value().to_lock() == lock);

    // ecto 0.2.1 pins ex_doc to 0.1.0, so unlocking ex_doc alone keeps it
    ResolveOptions opts;
    opts.update = {"ex_doc"};
    auto updated = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock, opts);
    REQUIRE(updated.is_ok());
    REQUIRE(version_of(updated.value(), "ex_doc") == "0.1.0");
    REQUIRE_FALSE(updated.value().find("ex_doc")->from_lock);
}

TEST_CASE("update releases one package from the lock", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    LockFile lock = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{})
                        .value().to_lock();

    ResolveOptions opts;
    opts.update = {"ecto"};
    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock, opts);
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.1");
    REQUIRE(version_of(r.value(), "postgrex") == "0.2.1");
    REQUIRE(version_of(r.value(), "ex_doc") == "0.1.0");
    REQUIRE_FALSE(r.value().find("ecto")->from_lock);
}

TEST_CASE("update_all ignores the whole lock", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    LockFile lock = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{})
                        .value().to_lock();

    ResolveOptions opts;
    opts.update_all = true;
    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock, opts);
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.1");
    for (const auto& pkg : r.value().packages) {
        REQUIRE_FALSE(pkg.from_lock);
    }
}

TEST_CASE("stale lock entries are ignored", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    LockFile lock;
    LockEntry gone;
    gone.name = "ecto";
    gone.registry_name = "ecto";
    gone.source = "registry";
    gone.version = "0.1.0";
    lock.packages.push_back(gone);

    auto r = resolver.resolve({root_dep("ecto", ">= 0.0.0")}, lock);
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value(), "ecto") == "0.2.1");
    REQUIRE_FALSE(r.value().find("ecto")->from_lock);
}

TEST_CASE("resolving twice gives the same lock", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    std::vector<Requirement> root = {
        root_dep("phoenix", ">= 0.0.0"),
        root_dep("depend_name", ">= 0.0.0"),
    };
    auto first = resolver.resolve(root, LockFile{});
    REQUIRE(first.is_ok());
    LockFile lock = first.value().to_lock();

    auto second = resolver.resolve(root, lock);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().to_lock() == lock);
    REQUIRE(second.value().to_lock().serialize() == lock.serialize());
}

// ===== Output =====

TEST_CASE("install order puts dependencies first", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto res = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{}).value();
    auto order = res.install_order();
    REQUIRE(order.is_ok());
    REQUIRE(order.value() == std::vector<std::string>{"ex_doc", "postgrex", "ecto"});

    auto graph = res.dependency_graph();
    REQUIRE(graph.has_edge("postgrex", "ex_doc"));
    REQUIRE_FALSE(graph.has_cycle());
}

TEST_CASE("dependency tree", "[resolver]") {
    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto res = resolver.resolve({root_dep("ecto", "0.2.0")}, LockFile{}).value();
    std::string expected =
        "root\n"
        "└── ecto 0.2.0\n"
        "    ├── ex_doc 0.0.1\n"
        "    └── postgrex 0.2.0\n"
        "        └── ex_doc 0.0.1 (*)\n";
    REQUIRE(res.tree() == expected);
}

TEST_CASE("dependency tree marks path packages", "[resolver]") {
    TempDir tmp;
    write_package(tmp, "ex_doc", "ex_doc", "0.1.0");

    auto index = fixture_index();
    FsPathSource paths;
    Resolver resolver(index, paths);

    auto res = resolver.resolve({root_path("ex_doc", tmp.path / "ex_doc")}, LockFile{}).value();
    REQUIRE(res.tree() == "root\n└── ex_doc 0.1.0 (path)\n");
}
