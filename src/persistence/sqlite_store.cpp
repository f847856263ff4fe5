#include "persistence/sqlite_store.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pmkt {

SqliteStore::SqliteStore(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // WAL mode for crash safety between invocations
    execute("PRAGMA journal_mode = WAL;");

    initialize_schema();

    spdlog::info("SqliteStore opened: {}", db_path);
}

SqliteStore::~SqliteStore() {
    if (in_transaction_ && db_) {
        spdlog::warn("SqliteStore closed with open transaction, rolling back");
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        in_transaction_ = false;
    }
    close();
}

bool SqliteStore::is_open() const {
    return db_ != nullptr;
}

void SqliteStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::info("SqliteStore closed");
    }
}

void SqliteStore::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

void SqliteStore::initialize_schema() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )");

    execute(R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        );
    )");

    execute("INSERT OR IGNORE INTO schema_version (version) VALUES (1);");
}

int SqliteStore::get_schema_version() {
    auto stmt = prepare("SELECT version FROM schema_version LIMIT 1;");
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    finalize(stmt);
    return version;
}

// ============================================================================
// KEY/VALUE OPERATIONS
// ============================================================================

std::optional<nlohmann::json> SqliteStore::get(const StorageKey& key) const {
    auto stmt = prepare("SELECT value FROM kv WHERE key = ?;");
    bind_text(stmt, 1, encode_key(key));

    std::optional<nlohmann::json> result;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        std::string text = get_text(stmt, 0);
        finalize(stmt);
        result = nlohmann::json::parse(text);
        return result;
    }
    finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Failed to read key " + encode_key(key) + ": " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return result;
}

void SqliteStore::set(const StorageKey& key, const nlohmann::json& value) {
    auto stmt = prepare(R"(
        INSERT INTO kv (key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value;
    )");
    bind_text(stmt, 1, encode_key(key));
    bind_text(stmt, 2, value.dump());
    step_done(stmt, "write key");
}

void SqliteStore::remove(const StorageKey& key) {
    auto stmt = prepare("DELETE FROM kv WHERE key = ?;");
    bind_text(stmt, 1, encode_key(key));
    step_done(stmt, "delete key");
}

size_t SqliteStore::size() const {
    auto stmt = prepare("SELECT COUNT(*) FROM kv;");
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    finalize(stmt);
    return count;
}

// ============================================================================
// TRANSACTIONS
// ============================================================================

void SqliteStore::begin_transaction() {
    if (in_transaction_) {
        throw std::logic_error("SqliteStore: transaction already open");
    }
    execute("BEGIN IMMEDIATE TRANSACTION;");
    in_transaction_ = true;
}

void SqliteStore::commit_transaction() {
    if (!in_transaction_) {
        throw std::logic_error("SqliteStore: commit without transaction");
    }
    execute("COMMIT;");
    in_transaction_ = false;
}

void SqliteStore::rollback_transaction() {
    if (!in_transaction_) {
        throw std::logic_error("SqliteStore: rollback without transaction");
    }
    in_transaction_ = false;
    execute("ROLLBACK;");
}

// ============================================================================
// STATEMENT HELPERS
// ============================================================================

sqlite3_stmt* SqliteStore::prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteStore::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) const {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteStore::finalize(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

std::string SqliteStore::get_text(sqlite3_stmt* stmt, int col) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

void SqliteStore::step_done(sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to ") + what + ": " +
                                 sqlite3_errmsg(db_));
    }
}

} // namespace pmkt
