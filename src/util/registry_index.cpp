#include <depot/registry_index.hpp>
#include <depot/manifest.hpp>
#include <depot/log.hpp>
#include <sqlite3.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace depot {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "2";

static std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

struct RegistryIndex::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_versions = nullptr;
    sqlite3_stmt* stmt_checksum = nullptr;
    sqlite3_stmt* stmt_requirements = nullptr;
    sqlite3_stmt* stmt_insert_release = nullptr;
    sqlite3_stmt* stmt_delete_requirements = nullptr;
    sqlite3_stmt* stmt_insert_requirement = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_versions);
        fin(stmt_checksum);
        fin(stmt_requirements);
        fin(stmt_insert_release);
        fin(stmt_delete_requirements);
        fin(stmt_insert_requirement);
    }

    Status require_open() const {
        if (!db) {
            return DepotError(DepotError::IO, "registry index is not open");
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) {
            sqlite3_reset(out);
            sqlite3_clear_bindings(out);
            return ok_status();
        }
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return DepotError(DepotError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return DepotError(DepotError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        DEPOT_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS release ("
            "  name TEXT,"
            "  version TEXT,"
            "  checksum TEXT,"
            "  PRIMARY KEY (name, version)"
            ");"
            "CREATE TABLE IF NOT EXISTS requirement ("
            "  name TEXT,"
            "  version TEXT,"
            "  position INTEGER,"
            "  dep_name TEXT,"
            "  requirement TEXT,"
            "  package TEXT,"
            "  optional INTEGER,"
            "  PRIMARY KEY (name, version, position)"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return DepotError(DepotError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        std::string stored;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            stored = column_text(stmt, 0);
        }
        sqlite3_finalize(stmt);

        if (stored == SCHEMA_VERSION) return ok_status();

        if (!stored.empty()) {
            // Older snapshot layout: drop it, the next import refills it
            log::warn("registry index schema %s is outdated, clearing it",
                      stored.c_str());
            DEPOT_TRY(exec("DELETE FROM release; DELETE FROM requirement;"));
        }
        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(ver_sql.c_str());
    }

    // Inserts one release; the caller owns the transaction
    Status insert_release(const Release& release) {
        for (const auto& req : release.requirements) {
            if (req.path || req.override) {
                return DepotError(DepotError::InvalidArg,
                    "release " + release.name + " " + release.version.to_string() +
                    ": registry requirement '" + req.name +
                    "' cannot use a path or an override");
            }
            if (!req.requirement) {
                return DepotError(DepotError::InvalidArg,
                    "release " + release.name + " " + release.version.to_string() +
                    ": requirement '" + req.name + "' has no version");
            }
        }

        std::string version = release.version.to_string();

        DEPOT_TRY(prepare(
            "INSERT OR REPLACE INTO release (name, version, checksum) VALUES (?, ?, ?)",
            stmt_insert_release));
        sqlite3_bind_text(stmt_insert_release, 1, release.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_release, 2, version.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert_release, 3, release.checksum.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_insert_release) != SQLITE_DONE) {
            return DepotError(DepotError::IO,
                std::string("Failed to store release: ") + sqlite3_errmsg(db));
        }

        DEPOT_TRY(prepare(
            "DELETE FROM requirement WHERE name=? AND version=?",
            stmt_delete_requirements));
        sqlite3_bind_text(stmt_delete_requirements, 1, release.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_delete_requirements, 2, version.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_delete_requirements) != SQLITE_DONE) {
            return DepotError(DepotError::IO,
                std::string("Failed to clear requirements: ") + sqlite3_errmsg(db));
        }

        int position = 0;
        for (const auto& req : release.requirements) {
            DEPOT_TRY(prepare(
                "INSERT INTO requirement "
                "(name, version, position, dep_name, requirement, package, optional) "
                "VALUES (?, ?, ?, ?, ?, ?, ?)",
                stmt_insert_requirement));
            sqlite3_bind_text(stmt_insert_requirement, 1, release.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt_insert_requirement, 2, version.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt_insert_requirement, 3, position++);
            sqlite3_bind_text(stmt_insert_requirement, 4, req.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt_insert_requirement, 5, req.requirement->c_str(), -1, SQLITE_TRANSIENT);
            if (req.package) {
                sqlite3_bind_text(stmt_insert_requirement, 6, req.package->c_str(), -1, SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(stmt_insert_requirement, 6);
            }
            sqlite3_bind_int(stmt_insert_requirement, 7, req.optional ? 1 : 0);
            if (sqlite3_step(stmt_insert_requirement) != SQLITE_DONE) {
                return DepotError(DepotError::IO,
                    std::string("Failed to store requirement: ") + sqlite3_errmsg(db));
            }
        }
        return ok_status();
    }

    // Runs fn inside BEGIN/COMMIT, rolling back on failure
    template<typename F>
    Status transaction(F&& fn) {
        DEPOT_TRY(exec("BEGIN;"));
        Status st = fn();
        if (st.is_err()) {
            auto rollback = exec("ROLLBACK;");
            if (rollback.is_err()) {
                log::error("%s", rollback.error().message.c_str());
            }
            return st;
        }
        return exec("COMMIT;");
    }
};

// ---------------------------------------------------------------------------
// RegistryIndex public interface
// ---------------------------------------------------------------------------

RegistryIndex::RegistryIndex() : impl_(std::make_unique<Impl>()) {}
RegistryIndex::~RegistryIndex() = default;
RegistryIndex::RegistryIndex(RegistryIndex&&) noexcept = default;
RegistryIndex& RegistryIndex::operator=(RegistryIndex&&) noexcept = default;

std::string RegistryIndex::default_index_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.depot/registry.db";
}

Status RegistryIndex::open(const std::string& db_path) {
    close();

    bool in_memory = db_path == ":memory:";
    if (!in_memory) {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return DepotError(DepotError::IO,
                    "Failed to create registry directory: " + parent.string());
            }
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return DepotError(DepotError::IO,
            "Failed to open registry index " + db_path + ": " + err_msg);
    }

    auto setup = [&]() -> Status {
        if (!in_memory) {
            DEPOT_TRY(impl_->exec(
                "PRAGMA journal_mode=WAL;"
                "PRAGMA synchronous=NORMAL;"
            ));
        }
        DEPOT_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err() && !in_memory) {
        // Corrupt snapshot: it is only a copy of registry data, start over
        log::warn("registry index %s is unreadable, recreating it",
                  db_path.c_str());
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return DepotError(DepotError::IO,
                "Failed to recreate registry index " + db_path);
        }
        setup_result = setup();
    }
    if (setup_result.is_err()) {
        close();
        return setup_result;
    }

    return ok_status();
}

void RegistryIndex::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool RegistryIndex::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Population
// ---------------------------------------------------------------------------

Status RegistryIndex::add_release(const Release& release) {
    DEPOT_TRY(impl_->require_open());
    return impl_->transaction([&]() { return impl_->insert_release(release); });
}

static Result<std::vector<Release>> parse_snapshot(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("registry snapshot parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    std::vector<Release> releases;
    auto* arr = doc["releases"].as_array();
    if (!arr) {
        return Result<std::vector<Release>>::ok(std::move(releases));
    }

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) {
            return DepotError{DepotError::Parse,
                "every [[releases]] entry must be a table"};
        }

        auto name = (*tbl)["name"].value<std::string>();
        auto version = (*tbl)["version"].value<std::string>();
        if (!name || !version) {
            return DepotError{DepotError::Parse,
                "release entry needs 'name' and 'version'", "", "",
                static_cast<int>(tbl->source().begin.line)};
        }

        auto parsed = Version::parse(*version);
        if (parsed.is_err()) {
            return DepotError{DepotError::Parse,
                "release " + *name + ": " + parsed.error().message};
        }

        Release rel;
        rel.name = *name;
        rel.version = std::move(parsed).value();
        rel.checksum = (*tbl)["checksum"].value_or(std::string{});

        if (auto deps = (*tbl)["dependencies"].as_table()) {
            auto reqs = parse_dependencies(*deps);
            if (reqs.is_err()) return std::move(reqs).error();
            rel.requirements = std::move(reqs).value();
        }
        releases.push_back(std::move(rel));
    }

    return Result<std::vector<Release>>::ok(std::move(releases));
}

Status RegistryIndex::import_snapshot(const std::string& toml_str) {
    DEPOT_TRY(impl_->require_open());

    auto releases = parse_snapshot(toml_str);
    if (releases.is_err()) return std::move(releases).error();

    DEPOT_TRY(impl_->transaction([&]() -> Status {
        for (const auto& rel : releases.value()) {
            DEPOT_TRY(impl_->insert_release(rel));
        }
        return ok_status();
    }));

    log::debug("imported %zu releases into registry index",
               releases.value().size());
    return ok_status();
}

Status RegistryIndex::import_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError(DepotError::IO,
            "cannot open registry snapshot: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto st = import_snapshot(ss.str());
    if (st.is_err() && st.error().file.empty()) {
        st.error().file = path;
    }
    return st;
}

Result<RegistryStats> RegistryIndex::stat() {
    DEPOT_TRY(impl_->require_open());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT COUNT(DISTINCT name), COUNT(*) FROM release", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return DepotError(DepotError::IO,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }

    RegistryStats stats;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.packages = sqlite3_column_int64(stmt, 0);
        stats.releases = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return Result<RegistryStats>::ok(stats);
}

// ---------------------------------------------------------------------------
// Registry lookups
// ---------------------------------------------------------------------------

Result<std::vector<Version>> RegistryIndex::versions(const std::string& name) {
    DEPOT_TRY(impl_->require_open());
    DEPOT_TRY(impl_->prepare(
        "SELECT version FROM release WHERE name=?",
        impl_->stmt_versions));
    sqlite3_bind_text(impl_->stmt_versions, 1, name.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Version> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_versions)) == SQLITE_ROW) {
        std::string text = column_text(impl_->stmt_versions, 0);
        auto v = Version::parse(text);
        if (v.is_err()) {
            return DepotError(DepotError::MalformedMetadata,
                "registry lists invalid version '" + text + "' for " + name);
        }
        out.push_back(std::move(v).value());
    }
    if (rc != SQLITE_DONE) {
        return DepotError(DepotError::IO,
            std::string("Failed to read versions: ") + sqlite3_errmsg(impl_->db));
    }

    if (out.empty()) {
        return DepotError(DepotError::NotFound,
            "no package named '" + name + "' in registry");
    }

    std::sort(out.begin(), out.end());
    return Result<std::vector<Version>>::ok(std::move(out));
}

Result<std::string> RegistryIndex::checksum(const std::string& name,
                                           const Version& version) {
    DEPOT_TRY(impl_->require_open());
    DEPOT_TRY(impl_->prepare(
        "SELECT checksum FROM release WHERE name=? AND version=?",
        impl_->stmt_checksum));

    std::string ver = version.to_string();
    sqlite3_bind_text(impl_->stmt_checksum, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmt_checksum, 2, ver.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_checksum);
    std::string sum = rc == SQLITE_ROW ? column_text(impl_->stmt_checksum, 0) : "";
    sqlite3_reset(impl_->stmt_checksum);

    if (rc == SQLITE_ROW) {
        return Result<std::string>::ok(std::move(sum));
    }
    if (rc != SQLITE_DONE) {
        return DepotError(DepotError::IO,
            std::string("Failed to read checksum: ") + sqlite3_errmsg(impl_->db));
    }
    return DepotError(DepotError::NotFound,
        "no release " + name + " " + ver + " in registry");
}

Result<std::vector<RawRequirement>> RegistryIndex::requirements(
    const std::string& name, const Version& version)
{
    // Distinguish "unknown release" from "release without requirements"
    auto exists = checksum(name, version);
    if (exists.is_err()) return std::move(exists).error();

    DEPOT_TRY(impl_->prepare(
        "SELECT dep_name, requirement, package, optional FROM requirement "
        "WHERE name=? AND version=? ORDER BY position",
        impl_->stmt_requirements));

    std::string ver = version.to_string();
    sqlite3_bind_text(impl_->stmt_requirements, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmt_requirements, 2, ver.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<RawRequirement> out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_requirements)) == SQLITE_ROW) {
        RawRequirement req;
        req.name = column_text(impl_->stmt_requirements, 0);
        req.requirement = column_text(impl_->stmt_requirements, 1);
        if (sqlite3_column_type(impl_->stmt_requirements, 2) != SQLITE_NULL) {
            req.package = column_text(impl_->stmt_requirements, 2);
        }
        req.optional = sqlite3_column_int(impl_->stmt_requirements, 3) != 0;

        auto valid = req.validate();
        if (valid.is_err()) {
            return DepotError(DepotError::MalformedMetadata,
                "release " + name + " " + ver + ": " + valid.error().message);
        }
        out.push_back(std::move(req));
    }
    if (rc != SQLITE_DONE) {
        return DepotError(DepotError::IO,
            std::string("Failed to read requirements: ") + sqlite3_errmsg(impl_->db));
    }

    return Result<std::vector<RawRequirement>>::ok(std::move(out));
}

} // namespace depot
