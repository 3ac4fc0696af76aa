#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace objxfer {

/// Persisted state of a resumable upload session.
struct SessionRecord {
    std::string uri;
    std::vector<uint8_t> first_chunk;  // content-identity prefix
    int64_t updated_at = 0;            // epoch seconds
};

/// Key/value store for resumable session records, keyed by
/// `{bucket}/{object}[/{generation}]`. Writes are last-writer-wins.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual std::optional<SessionRecord> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const SessionRecord& record) = 0;
    virtual void remove(const std::string& key) = 0;

    /// All records, ordered by key.
    virtual std::vector<std::pair<std::string, SessionRecord>> list() = 0;
};

/// Build the store key for an object. `generation` of 0 is omitted.
std::string session_cache_key(const std::string& bucket, const std::string& object,
                              int64_t generation = 0);

/// In-process store. Used by tests and when persistence is disabled.
class MemoryConfigStore : public ConfigStore {
public:
    std::optional<SessionRecord> get(const std::string& key) override;
    void set(const std::string& key, const SessionRecord& record) override;
    void remove(const std::string& key) override;
    std::vector<std::pair<std::string, SessionRecord>> list() override;

private:
    std::mutex mutex_;
    std::map<std::string, SessionRecord> records_;
};

/// SQLite-backed store (WAL mode) shared by every process on the host.
class SqliteConfigStore : public ConfigStore {
public:
    /// Opens (creating parent directories and schema as needed).
    /// Throws std::runtime_error if the database cannot be opened.
    explicit SqliteConfigStore(const std::filesystem::path& db_path);
    ~SqliteConfigStore() override;

    SqliteConfigStore(const SqliteConfigStore&) = delete;
    SqliteConfigStore& operator=(const SqliteConfigStore&) = delete;

    std::optional<SessionRecord> get(const std::string& key) override;
    void set(const std::string& key, const SessionRecord& record) override;
    void remove(const std::string& key) override;
    /// Throws std::runtime_error if the scan stops before the last row.
    std::vector<std::pair<std::string, SessionRecord>> list() override;

    /// Delete every record. Returns the number removed.
    size_t clear();

private:
    // Finalize statements and close the handle
    void close();

    std::mutex mutex_;
    sqlite3* db_ = nullptr;

    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
};

}  // namespace objxfer
