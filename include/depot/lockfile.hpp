#pragma once

#include <depot/result.hpp>
#include <depot/requirement.hpp>
#include <string>
#include <vector>

namespace depot {

// File name of the lock beside Depot.toml
inline const std::string LOCK_FILE = "Depot.lock";

struct LockEntry {
    std::string name;           // PackageIdentity
    std::string registry_name;  // name the registry was queried with
    std::string source;         // "registry" or "path+<path>"
    std::string version;
    std::string checksum;       // registry checksum (empty for path sources)
    std::vector<std::string> dependencies;  // identities, sorted

    bool is_path() const { return source.rfind("path+", 0) == 0; }

    bool operator==(const LockEntry& o) const;
    bool operator!=(const LockEntry& o) const { return !(*this == o); }
};

struct LockFile {
    int version = 1;
    std::vector<LockEntry> packages;  // sorted by name

    // Parse Depot.lock contents
    static Result<LockFile> parse(const std::string& toml_str);

    // Parse a Depot.lock file from disk
    static Result<LockFile> load(const std::string& path);

    // Deterministic TOML rendering (entries sorted by name)
    std::string serialize() const;

    // Write to <path>.tmp, then rename over path
    Status save(const std::string& path) const;

    // Find a locked package by identity (nullptr if not found)
    const LockEntry* find(const std::string& name) const;

    bool empty() const { return packages.empty(); }

    bool operator==(const LockFile& o) const;
    bool operator!=(const LockFile& o) const { return !(*this == o); }
};

// Read/write access to one project's lock file
class LockStore {
public:
    explicit LockStore(std::string path) : path_(std::move(path)) {}

    // A missing lock file reads as an empty lock
    Result<LockFile> read() const;

    // Persists lock unless the stored one is already equal.
    // Returns true when the file was rewritten.
    Result<bool> write(const LockFile& lock) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace depot
