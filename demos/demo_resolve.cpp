// demo_resolve.cpp
//
// Resolves a project's dependencies against a local registry index and
// writes its Depot.lock, printing what was selected.  Run it with:
//
//     ./demo_resolve                                   # project in cwd
//     ./demo_resolve path/to/project --registry ../tests/fixtures/registry.toml
//     ./demo_resolve path/to/project --update ecto     # unlock one package
//     ./demo_resolve path/to/project --update-all --tree
//
// --registry accepts either a SQLite index or a TOML registry snapshot
// (loaded into an in-memory index).  Without it the configured index is used.

#include <depot/config.hpp>
#include <depot/log.hpp>
#include <depot/project.hpp>
#include <depot/registry_index.hpp>
#include <depot/report.hpp>
#include <depot/result.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace depot;

struct Args {
    std::string project_dir = ".";
    std::string registry;
    ResolveOptions options;
    bool tree = false;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    bool have_dir = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--registry" || a == "--update") {
            if (i + 1 >= argc) {
                return DepotError{DepotError::InvalidArg,
                    a + " needs a value",
                    "usage: demo_resolve [dir] [--registry <file>] [--update <pkg>]... "
                    "[--update-all] [--no-local] [--tree]"};
            }
            if (a == "--registry") args.registry = argv[++i];
            else args.options.update.push_back(argv[++i]);
        } else if (a == "--update-all") {
            args.options.update_all = true;
        } else if (a == "--no-local") {
            args.options.no_local = true;
        } else if (a == "--tree") {
            args.tree = true;
        } else if (!have_dir && a.rfind("--", 0) != 0) {
            args.project_dir = a;
            have_dir = true;
        } else {
            return DepotError{DepotError::InvalidArg, "unknown argument: " + a};
        }
    }
    return Result<Args>::ok(std::move(args));
}

// Snapshots (.toml) are imported into a transient index
Status open_registry(RegistryIndex& index, const std::string& path) {
    if (fs::path(path).extension() == ".toml") {
        DEPOT_TRY(index.open(":memory:"));
        return index.import_file(path);
    }
    return index.open(path);
}

Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    DEPOT_TRY(args);

    auto project = Project::discover(args.value().project_dir);
    DEPOT_TRY(project);

    auto global = load_optional_config(global_config_path());
    DEPOT_TRY(global);
    auto local = load_optional_config(
        project_config_path(project.value().root_dir.string()));
    DEPOT_TRY(local);

    Config cfg = Config::effective(global.value(), local.value());
    cfg.apply_logging();

    ResolveOptions options = args.value().options;
    options.no_local = options.no_local || cfg.resolve.no_local;

    std::string registry_path = args.value().registry.empty()
        ? cfg.registry_path() : args.value().registry;

    RegistryIndex index;
    DEPOT_TRY(open_registry(index, registry_path));

    auto stats = index.stat();
    DEPOT_TRY(stats);
    log::info("registry %s: %lld packages, %lld releases", registry_path.c_str(),
              static_cast<long long>(stats.value().packages),
              static_cast<long long>(stats.value().releases));

    auto outcome = lock_project(project.value(), index, options);
    DEPOT_TRY(outcome);

    const auto& resolution = outcome.value().resolution;
    for (const auto& entry : build_report(resolution, outcome.value().previous)) {
        std::cout << "* " << entry.app << " " << entry.version;
        if (entry.source_kind == "path") {
            std::cout << " (" << entry.path << ")\n";
        } else {
            std::cout << " (" << entry.registry_name << ")\n";
        }
        if (entry.locked) {
            std::cout << "  locked at " << entry.locked_version << "\n";
        } else if (!entry.locked_version.empty()) {
            std::cout << "  updated from " << entry.locked_version << "\n";
        }
        std::cout << "  ok\n";
    }

    if (args.value().tree) {
        std::cout << "\n" << resolution.tree();
    }

    auto order = resolution.install_order();
    DEPOT_TRY(order);
    std::cout << "\ninstall order:";
    for (const auto& name : order.value()) std::cout << " " << name;
    std::cout << "\n";

    std::cout << (outcome.value().lock_written ? "lock updated: " : "lock unchanged: ")
              << project.value().lock_path().string() << "\n";
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
