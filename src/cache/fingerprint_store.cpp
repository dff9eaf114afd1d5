#include <weft/cache/fingerprint_store.hpp>
#include <weft/log.hpp>
#include <sqlite3.h>

#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace weft {

static const std::string SCHEMA_VERSION = "1";

struct FingerprintStore::Impl {
    sqlite3* db = nullptr;
    std::string path;
    bool recreated = false;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_load = nullptr;
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_count = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_load);
        fin(stmt_lookup);
        fin(stmt_insert);
        fin(stmt_count);
    }

    void close_db() {
        finalize_all();
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return WeftError(WeftError::IO,
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
            return WeftError(WeftError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status write_version() {
        std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                          "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(sql.c_str());
    }

    Status init_schema() {
        WEFT_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS fingerprint ("
            "  class_name TEXT PRIMARY KEY,"
            "  digest BLOB NOT NULL,"
            "  canonical BLOB"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return WeftError(WeftError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        std::string found;
        if (rc == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (ver) found = ver;
        }
        sqlite3_finalize(stmt);

        if (rc == SQLITE_ROW && found == SCHEMA_VERSION) return ok_status();
        if (rc == SQLITE_ROW) {
            // Rows written by another layout are never trusted
            log::info("fingerprint store %s has layout %s, expected %s; clearing",
                      path.c_str(), found.c_str(), SCHEMA_VERSION.c_str());
            WEFT_TRY(exec("DELETE FROM fingerprint;"));
        }
        return write_version();
    }

    Status setup() {
        WEFT_TRY(exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
            "PRAGMA busy_timeout=5000;"
        ));
        return init_schema();
    }

    void remove_files() {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path + "-wal", ec);
        fs::remove(path + "-shm", ec);
    }
};

// Rows without a name or with a digest of the wrong size were not written
// by this store
static Result<abi::Fingerprint> read_row(sqlite3_stmt* stmt) {
    abi::Fingerprint fp;
    const auto* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    if (!name) {
        return WeftError(WeftError::IO, "corrupt fingerprint row: no class name",
                         "the cache will be rebuilt on next open");
    }
    fp.class_name = name;
    const void* digest = sqlite3_column_blob(stmt, 1);
    int digest_len = sqlite3_column_bytes(stmt, 1);
    if (!digest || digest_len != static_cast<int>(fp.digest.size())) {
        return WeftError(WeftError::IO,
            "corrupt fingerprint row for " + fp.class_name + ": bad digest",
            "the cache will be rebuilt on next open");
    }
    std::memcpy(fp.digest.data(), digest, fp.digest.size());
    const auto* canonical = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, 2));
    int canonical_len = sqlite3_column_bytes(stmt, 2);
    if (canonical && canonical_len > 0) {
        fp.canonical.assign(canonical, canonical + canonical_len);
    }
    return Result<abi::Fingerprint>::ok(std::move(fp));
}

// ---------------------------------------------------------------------------
// FingerprintStore public interface
// ---------------------------------------------------------------------------

FingerprintStore::FingerprintStore() : impl_(std::make_unique<Impl>()) {}
FingerprintStore::~FingerprintStore() = default;
FingerprintStore::FingerprintStore(FingerprintStore&&) noexcept = default;
FingerprintStore& FingerprintStore::operator=(FingerprintStore&&) noexcept = default;

Status FingerprintStore::open(const std::string& db_path) {
    close();
    impl_->path = db_path;
    impl_->recreated = false;

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    auto setup_result = rc == SQLITE_OK
        ? impl_->setup()
        : Status(WeftError(WeftError::IO,
              std::string("Failed to open fingerprint store: ")
              + (impl_->db ? sqlite3_errmsg(impl_->db) : "unknown")));

    if (setup_result.is_err()) {
        // Corrupt payload: start over with an empty generation
        log::warn("fingerprint store %s is unusable (%s); recreating",
                  db_path.c_str(), setup_result.error().message.c_str());
        impl_->close_db();
        impl_->remove_files();
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            impl_->close_db();
            return WeftError(WeftError::IO, "Failed to recreate fingerprint store " + db_path);
        }
        auto retry = impl_->setup();
        if (retry.is_err()) {
            impl_->close_db();
            return retry;
        }
        impl_->recreated = true;
    }

    return ok_status();
}

void FingerprintStore::close() {
    impl_->close_db();
}

bool FingerprintStore::is_open() const {
    return impl_->db != nullptr;
}

bool FingerprintStore::recreated() const {
    return impl_->recreated;
}

Result<abi::FingerprintMap> FingerprintStore::load() {
    WEFT_TRY(impl_->prepare(
        "SELECT class_name, digest, canonical FROM fingerprint",
        impl_->stmt_load));

    sqlite3_reset(impl_->stmt_load);
    abi::FingerprintMap out;
    int rc;
    while ((rc = sqlite3_step(impl_->stmt_load)) == SQLITE_ROW) {
        auto fp = read_row(impl_->stmt_load);
        WEFT_TRY(fp);
        std::string name = fp.value().class_name;
        out.emplace(std::move(name), std::move(fp).value());
    }
    if (rc != SQLITE_DONE) {
        return WeftError(WeftError::IO,
            std::string("Failed to load fingerprints: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<abi::FingerprintMap>::ok(std::move(out));
}

Result<abi::Fingerprint> FingerprintStore::lookup(const std::string& class_name) {
    WEFT_TRY(impl_->prepare(
        "SELECT class_name, digest, canonical FROM fingerprint WHERE class_name=?",
        impl_->stmt_lookup));

    sqlite3_reset(impl_->stmt_lookup);
    sqlite3_bind_text(impl_->stmt_lookup, 1, class_name.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(impl_->stmt_lookup);
    if (rc == SQLITE_ROW) {
        return read_row(impl_->stmt_lookup);
    }
    if (rc != SQLITE_DONE) {
        return WeftError(WeftError::IO,
            std::string("Failed to look up fingerprint: ") + sqlite3_errmsg(impl_->db));
    }
    return WeftError(WeftError::NotFound, "No fingerprint for: " + class_name);
}

Status FingerprintStore::replace_all(const abi::FingerprintMap& generation) {
    WEFT_TRY(impl_->prepare(
        "INSERT INTO fingerprint (class_name, digest, canonical) VALUES (?, ?, ?)",
        impl_->stmt_insert));

    WEFT_TRY(impl_->exec("BEGIN IMMEDIATE;"));

    auto body = [&]() -> Status {
        WEFT_TRY(impl_->exec("DELETE FROM fingerprint;"));
        for (const auto& [name, fp] : generation) {
            sqlite3_stmt* s = impl_->stmt_insert;
            sqlite3_reset(s);
            sqlite3_bind_text(s, 1, name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_blob(s, 2, fp.digest.data(), static_cast<int>(fp.digest.size()),
                              SQLITE_TRANSIENT);
            if (fp.canonical.empty()) {
                sqlite3_bind_null(s, 3);
            } else {
                sqlite3_bind_blob(s, 3, fp.canonical.data(),
                                  static_cast<int>(fp.canonical.size()), SQLITE_TRANSIENT);
            }
            if (sqlite3_step(s) != SQLITE_DONE) {
                return WeftError(WeftError::IO,
                    "Failed to store fingerprint for " + name + ": " + sqlite3_errmsg(impl_->db));
            }
        }
        return ok_status();
    };

    auto result = body();
    if (result.is_err()) {
        auto rolled_back = impl_->exec("ROLLBACK;");
        if (rolled_back.is_err()) {
            log::warn("%s", rolled_back.error().message.c_str());
        }
        return result;
    }
    return impl_->exec("COMMIT;");
}

Status FingerprintStore::clear() {
    return impl_->exec("DELETE FROM fingerprint;");
}

Result<int64_t> FingerprintStore::count() {
    WEFT_TRY(impl_->prepare("SELECT COUNT(*) FROM fingerprint", impl_->stmt_count));
    sqlite3_reset(impl_->stmt_count);
    if (sqlite3_step(impl_->stmt_count) != SQLITE_ROW) {
        return WeftError(WeftError::IO,
            std::string("Failed to count fingerprints: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<int64_t>::ok(sqlite3_column_int64(impl_->stmt_count, 0));
}

} // namespace weft
