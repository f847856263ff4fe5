#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "storage/key_value_store.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace pmkt {

// ============================================================================
// SQLITE-BACKED CONTRACT STORAGE
//
// One row per storage key in table `kv` (key TEXT PRIMARY KEY, value TEXT).
// Store transactions map directly onto SQLite transactions, so an aborted
// operation leaves the file exactly as it was.
// ============================================================================

class SqliteStore : public KeyValueStore {
public:
    explicit SqliteStore(const std::string& db_path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool is_open() const;
    void close();

    // Schema management
    void initialize_schema();
    int get_schema_version();

    std::optional<nlohmann::json> get(const StorageKey& key) const override;
    void set(const StorageKey& key, const nlohmann::json& value) override;
    void remove(const StorageKey& key) override;

    void begin_transaction() override;
    void commit_transaction() override;
    void rollback_transaction() override;
    bool in_transaction() const override { return in_transaction_; }

    size_t size() const override;

    const std::string& path() const { return db_path_; }

private:
    sqlite3* db_{nullptr};
    std::string db_path_;
    bool in_transaction_{false};

    void execute(const std::string& sql);

    // Statement preparation helpers
    sqlite3_stmt* prepare(const std::string& sql) const;
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) const;
    void finalize(sqlite3_stmt* stmt) const;
    std::string get_text(sqlite3_stmt* stmt, int col) const;
    void step_done(sqlite3_stmt* stmt, const char* what);
};

} // namespace pmkt
