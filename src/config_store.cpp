#include "objxfer/config_store.hpp"
#include "objxfer/log.hpp"

#include <sqlite3.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace objxfer {

namespace {

const char* SESSION_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS upload_sessions (
    cache_key   TEXT PRIMARY KEY,
    uri         TEXT NOT NULL,
    first_chunk BLOB,
    updated_at  INTEGER NOT NULL
);
)";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("Session store SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("Session store SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void prepare(sqlite3* db, const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare session store statement: " +
                                 std::string(sqlite3_errmsg(db)));
    }
}

SessionRecord read_record(sqlite3_stmt* stmt, int first_col) {
    SessionRecord record;
    auto uri = sqlite3_column_text(stmt, first_col);
    if (uri) record.uri = reinterpret_cast<const char*>(uri);

    auto blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, first_col + 1));
    int blob_len = sqlite3_column_bytes(stmt, first_col + 1);
    if (blob && blob_len > 0) {
        record.first_chunk.assign(blob, blob + blob_len);
    }
    record.updated_at = sqlite3_column_int64(stmt, first_col + 2);
    return record;
}

}  // namespace

std::string session_cache_key(const std::string& bucket, const std::string& object,
                              int64_t generation) {
    std::string key = bucket + "/" + object;
    if (generation != 0) {
        key += "/" + std::to_string(generation);
    }
    return key;
}

// ============================================================================
// MemoryConfigStore
// ============================================================================

std::optional<SessionRecord> MemoryConfigStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void MemoryConfigStore::set(const std::string& key, const SessionRecord& record) {
    std::lock_guard lock(mutex_);
    records_[key] = record;
}

void MemoryConfigStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    records_.erase(key);
}

std::vector<std::pair<std::string, SessionRecord>> MemoryConfigStore::list() {
    std::lock_guard lock(mutex_);
    return {records_.begin(), records_.end()};
}

// ============================================================================
// SqliteConfigStore
// ============================================================================

SqliteConfigStore::SqliteConfigStore(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::filesystem::create_directories(db_path.parent_path());
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open session store: " + msg);
    }

    // WAL mode so several CLI processes can share the store
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, SESSION_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create session store schema at " + db_path.string());
    }

    try {
        prepare(db_,
            "INSERT OR REPLACE INTO upload_sessions (cache_key, uri, first_chunk, updated_at) "
            "VALUES (?1, ?2, ?3, ?4)",
            &stmt_upsert_);
        prepare(db_,
            "SELECT uri, first_chunk, updated_at FROM upload_sessions WHERE cache_key = ?1",
            &stmt_get_);
        prepare(db_,
            "DELETE FROM upload_sessions WHERE cache_key = ?1",
            &stmt_delete_);
        prepare(db_,
            "SELECT cache_key, uri, first_chunk, updated_at FROM upload_sessions ORDER BY cache_key",
            &stmt_list_);
    } catch (const std::runtime_error&) {
        // The destructor never runs for a half-built store
        close();
        throw;
    }
}

SqliteConfigStore::~SqliteConfigStore() {
    close();
}

void SqliteConfigStore::close() {
    for (sqlite3_stmt** stmt : {&stmt_upsert_, &stmt_get_, &stmt_delete_, &stmt_list_}) {
        if (*stmt) sqlite3_finalize(*stmt);
        *stmt = nullptr;
    }

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<SessionRecord> SqliteConfigStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_get_);
    sqlite3_bind_text(stmt_get_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_get_);
    if (rc != SQLITE_ROW) {
        if (rc != SQLITE_DONE) {
            log_warn("Session lookup failed for %s: %s", key.c_str(), sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt_get_);
        return std::nullopt;
    }

    auto record = read_record(stmt_get_, 0);
    sqlite3_reset(stmt_get_);
    return record;
}

void SqliteConfigStore::set(const std::string& key, const SessionRecord& record) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_upsert_);
    sqlite3_bind_text(stmt_upsert_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_upsert_, 2, record.uri.c_str(), -1, SQLITE_TRANSIENT);
    if (record.first_chunk.empty()) {
        sqlite3_bind_null(stmt_upsert_, 3);
    } else {
        sqlite3_bind_blob(stmt_upsert_, 3, record.first_chunk.data(),
                          static_cast<int>(record.first_chunk.size()), SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt_upsert_, 4, record.updated_at ? record.updated_at : now_epoch());

    int rc = sql_step_retry(stmt_upsert_);
    sqlite3_reset(stmt_upsert_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot persist session " + key + ": " + sqlite3_errmsg(db_));
    }
}

void SqliteConfigStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    sqlite3_reset(stmt_delete_);
    sqlite3_bind_text(stmt_delete_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sql_step_retry(stmt_delete_);
    sqlite3_reset(stmt_delete_);
    if (rc != SQLITE_DONE) {
        log_warn("Failed to delete session %s: %s", key.c_str(), sqlite3_errmsg(db_));
    }
}

std::vector<std::pair<std::string, SessionRecord>> SqliteConfigStore::list() {
    std::lock_guard lock(mutex_);
    std::vector<std::pair<std::string, SessionRecord>> out;

    sqlite3_reset(stmt_list_);
    int rc;
    // Resetting mid-scan would restart at the first row, so a busy
    // cursor is stepped again in place
    for (;;) {
        rc = sqlite3_step(stmt_list_);
        for (int attempt = 0; (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) && attempt < 10; ++attempt) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            rc = sqlite3_step(stmt_list_);
        }
        if (rc != SQLITE_ROW) break;

        auto key = sqlite3_column_text(stmt_list_, 0);
        out.emplace_back(key ? reinterpret_cast<const char*>(key) : "",
                         read_record(stmt_list_, 1));
    }
    std::string err = sqlite3_errmsg(db_);
    sqlite3_reset(stmt_list_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Cannot list sessions after " + std::to_string(out.size()) +
                                 " rows: " + err);
    }
    return out;
}

size_t SqliteConfigStore::clear() {
    std::lock_guard lock(mutex_);
    if (!sql_exec(db_, "DELETE FROM upload_sessions")) return 0;
    return static_cast<size_t>(sqlite3_changes(db_));
}

}  // namespace objxfer
