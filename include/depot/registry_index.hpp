#pragma once

#include <depot/result.hpp>
#include <depot/registry.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace depot {

struct RegistryStats {
    int64_t packages = 0;
    int64_t releases = 0;
};

// Local registry snapshot stored in SQLite. Serves as the Registry the
// resolver queries; populated from registry snapshots or release by release.
class RegistryIndex : public Registry {
public:
    RegistryIndex();
    ~RegistryIndex() override;
    RegistryIndex(RegistryIndex&&) noexcept;
    RegistryIndex& operator=(RegistryIndex&&) noexcept;

    // ":memory:" opens a transient index
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // ~/.depot/registry.db
    static std::string default_index_path();

    // Inserts or replaces one release with its requirements
    Status add_release(const Release& release);

    // TOML snapshot: [[releases]] tables with name, version, checksum and a
    // [releases.dependencies] table. All-or-nothing.
    Status import_snapshot(const std::string& toml_str);
    Status import_file(const std::string& path);

    Result<RegistryStats> stat();

    Result<std::vector<Version>> versions(const std::string& name) override;
    Result<std::vector<RawRequirement>> requirements(
        const std::string& name, const Version& version) override;
    Result<std::string> checksum(const std::string& name,
                                 const Version& version) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace depot
