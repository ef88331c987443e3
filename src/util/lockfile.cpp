#include <depot/lockfile.hpp>
#include <depot/log.hpp>
#include <depot/name.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace depot {

static const int LOCK_FORMAT_VERSION = 1;

bool LockEntry::operator==(const LockEntry& o) const {
    return name == o.name && registry_name == o.registry_name &&
           source == o.source && version == o.version &&
           checksum == o.checksum && dependencies == o.dependencies;
}

bool LockFile::operator==(const LockFile& o) const {
    return version == o.version && packages == o.packages;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static Result<LockEntry> parse_entry(const toml::table& tbl) {
    int line = static_cast<int>(tbl.source().begin.line);

    LockEntry entry;
    auto name = tbl["name"].value<std::string>();
    auto version = tbl["version"].value<std::string>();
    auto source = tbl["source"].value<std::string>();
    if (!name || !version || !source) {
        return DepotError{DepotError::Parse,
            "lock entry needs 'name', 'version' and 'source'", "", "", line};
    }

    auto identity = package_identity(*name);
    if (identity.is_err() || identity.value() != *name) {
        return DepotError{DepotError::Parse,
            "lock entry has invalid package identity '" + *name + "'", "", "", line};
    }

    auto src = DependencySource::from_string(*source);
    if (src.is_err()) {
        return DepotError{DepotError::Parse,
            "lock entry '" + *name + "': " + src.error().message, "", "", line};
    }

    auto ver = Version::parse(*version);
    if (ver.is_err()) {
        return DepotError{DepotError::Parse,
            "lock entry '" + *name + "': " + ver.error().message, "", "", line};
    }

    entry.name = *name;
    entry.version = *version;
    entry.source = *source;
    entry.registry_name = tbl["registry_name"].value_or(*name);
    entry.checksum = tbl["checksum"].value_or(std::string{});

    if (auto deps = tbl["dependencies"].as_array()) {
        for (const auto& d : *deps) {
            auto s = d.value<std::string>();
            if (!s) {
                return DepotError{DepotError::Parse,
                    "lock entry '" + *name + "': dependencies must be strings",
                    "", "", line};
            }
            entry.dependencies.push_back(*s);
        }
    }
    std::sort(entry.dependencies.begin(), entry.dependencies.end());

    return Result<LockEntry>::ok(std::move(entry));
}

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("Depot.lock parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    LockFile lock;
    auto format = doc["version"].value<int64_t>();
    if (!format) {
        return DepotError{DepotError::Parse,
            "Depot.lock has no format 'version'"};
    }
    if (*format != LOCK_FORMAT_VERSION) {
        return DepotError{DepotError::Parse,
            "unsupported Depot.lock format version " + std::to_string(*format),
            "regenerate the lock with this version of depot"};
    }
    lock.version = static_cast<int>(*format);

    if (auto arr = doc["package"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* tbl = elem.as_table();
            if (!tbl) {
                return DepotError{DepotError::Parse,
                    "every [[package]] entry must be a table"};
            }
            auto entry = parse_entry(*tbl);
            if (entry.is_err()) return std::move(entry).error();
            if (lock.find(entry.value().name)) {
                return DepotError{DepotError::Parse,
                    "package '" + entry.value().name + "' is locked twice"};
            }
            lock.packages.push_back(std::move(entry).value());
        }
    }

    std::sort(lock.packages.begin(), lock.packages.end(),
              [](const LockEntry& a, const LockEntry& b) { return a.name < b.name; });

    return Result<LockFile>::ok(std::move(lock));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError{DepotError::IO, "cannot open lock file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string LockFile::serialize() const {
    std::vector<const LockEntry*> sorted;
    for (const auto& e : packages) sorted.push_back(&e);
    std::sort(sorted.begin(), sorted.end(),
              [](const LockEntry* a, const LockEntry* b) { return a->name < b->name; });

    toml::array entries;
    for (const auto* e : sorted) {
        std::vector<std::string> deps = e->dependencies;
        std::sort(deps.begin(), deps.end());

        toml::array dep_arr;
        for (const auto& d : deps) dep_arr.push_back(d);

        toml::table tbl;
        tbl.insert("name", e->name);
        tbl.insert("registry_name", e->registry_name);
        tbl.insert("source", e->source);
        tbl.insert("version", e->version);
        tbl.insert("checksum", e->checksum);
        tbl.insert("dependencies", std::move(dep_arr));
        entries.push_back(std::move(tbl));
    }

    toml::table doc;
    doc.insert("version", static_cast<int64_t>(version));
    doc.insert("package", std::move(entries));

    std::ostringstream out;
    out << "# Generated by depot. Do not edit.\n";
    out << doc << "\n";
    return out.str();
}

Status LockFile::save(const std::string& path) const {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return DepotError{DepotError::IO, "cannot write lock file: " + tmp};
        }
        out << serialize();
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return DepotError{DepotError::IO, "failed writing lock file: " + tmp};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return DepotError{DepotError::IO,
            "cannot replace lock file " + path + ": " + ec.message()};
    }
    return ok_status();
}

const LockEntry* LockFile::find(const std::string& name) const {
    for (const auto& e : packages) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// LockStore
// ---------------------------------------------------------------------------

Result<LockFile> LockStore::read() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Result<LockFile>::ok(LockFile{});
    }
    return LockFile::load(path_);
}

Result<bool> LockStore::write(const LockFile& lock) const {
    auto current = read();
    if (current.is_ok() && current.value() == lock) {
        log::debug("lock %s is up to date", path_.c_str());
        return Result<bool>::ok(false);
    }
    if (current.is_err()) {
        log::warn("replacing unreadable lock %s: %s",
                  path_.c_str(), current.error().message.c_str());
    }

    DEPOT_TRY(lock.save(path_));
    log::info("wrote %s (%zu packages)", path_.c_str(), lock.packages.size());
    return Result<bool>::ok(true);
}

} // namespace depot
