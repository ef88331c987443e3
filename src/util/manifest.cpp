#include <depot/manifest.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace depot {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<RawRequirement> parse_dependency(const std::string& name,
                                               const toml::node& node) {
    RawRequirement dep;
    dep.name = name;

    if (auto req = node.value<std::string>()) {
        dep.requirement = *req;
    } else if (const auto* tbl = node.as_table()) {
        for (const auto& [key, val] : *tbl) {
            std::string k(key);
            if (k == "version" || k == "path" || k == "package") {
                auto s = val.value<std::string>();
                if (!s) {
                    return DepotError{DepotError::InvalidDeclaration,
                        "dependency '" + name + "': '" + k + "' must be a string"};
                }
                if (k == "version") dep.requirement = *s;
                else if (k == "path") dep.path = *s;
                else dep.package = *s;
            } else if (k == "optional" || k == "override") {
                auto b = val.value<bool>();
                if (!b) {
                    return DepotError{DepotError::InvalidDeclaration,
                        "dependency '" + name + "': '" + k + "' must be a boolean"};
                }
                if (k == "optional") dep.optional = *b;
                else dep.override = *b;
            } else {
                return DepotError{DepotError::InvalidDeclaration,
                    "dependency '" + name + "' has unknown key '" + k + "'",
                    "allowed keys: version, path, package, optional, override"};
            }
        }
    } else {
        return DepotError{DepotError::InvalidDeclaration,
            "dependency '" + name + "' must be a string or a table"};
    }

    DEPOT_TRY(dep.validate());
    return Result<RawRequirement>::ok(std::move(dep));
}

Result<std::vector<RawRequirement>> parse_dependencies(const toml::table& tbl) {
    // toml::table iterates keys alphabetically; restore source order
    struct Entry {
        toml::source_position pos;
        std::string name;
        const toml::node* node;
    };
    std::vector<Entry> entries;
    for (const auto& [key, val] : tbl) {
        entries.push_back({val.source().begin, std::string(key), &val});
    }
    std::stable_sort(entries.begin(), entries.end(),
        [](const Entry& a, const Entry& b) {
            if (a.pos.line != b.pos.line) return a.pos.line < b.pos.line;
            return a.pos.column < b.pos.column;
        });

    std::vector<RawRequirement> deps;
    for (const auto& e : entries) {
        auto dep = parse_dependency(e.name, *e.node);
        if (dep.is_err()) {
            auto err = std::move(dep).error();
            if (err.line == 0 && e.pos.line > 0) {
                err.line = static_cast<int>(e.pos.line);
            }
            return err;
        }
        deps.push_back(std::move(dep).value());
    }
    return Result<std::vector<RawRequirement>>::ok(std::move(deps));
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Manifest m;

    if (auto pkg = doc["package"].as_table()) {
        if (auto v = (*pkg)["name"].value<std::string>())
            m.package.name = *v;
        if (auto v = (*pkg)["version"].value<std::string>()) {
            auto parsed = Version::parse(*v);
            if (parsed.is_err()) {
                return DepotError{DepotError::Parse,
                    "invalid package version: " + parsed.error().message};
            }
            m.package.version = *v;
        }
    }

    if (auto deps = doc["dependencies"].as_table()) {
        auto parsed = parse_dependencies(*deps);
        if (parsed.is_err()) return std::move(parsed).error();
        m.dependencies = std::move(parsed).value();
    }

    return Result<Manifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Manifest::load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError{DepotError::IO,
            "cannot open manifest file: " + path};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    auto m = Manifest::parse(ss.str());
    if (m.is_err() && m.error().file.empty()) {
        m.error().file = path;
    }
    return m;
}

const RawRequirement* Manifest::find_dependency(const std::string& name) const {
    auto it = std::find_if(dependencies.begin(), dependencies.end(),
        [&](const RawRequirement& d) { return d.name == name; });
    return it == dependencies.end() ? nullptr : &*it;
}

} // namespace depot
