#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "storage/storage_key.hpp"

namespace pmkt {

/**
 * Persistent keyed store consumed by the market.
 *
 * Values are JSON documents addressed by a StorageKey. A transaction
 * groups the writes of one operation: commit() makes them visible,
 * rollback() discards all of them. Transactions do not nest.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<nlohmann::json> get(const StorageKey& key) const = 0;
    virtual void set(const StorageKey& key, const nlohmann::json& value) = 0;
    virtual void remove(const StorageKey& key) = 0;

    bool contains(const StorageKey& key) const { return get(key).has_value(); }

    // Transaction control
    virtual void begin_transaction() = 0;
    virtual void commit_transaction() = 0;
    virtual void rollback_transaction() = 0;
    virtual bool in_transaction() const = 0;

    // Number of stored keys (diagnostics)
    virtual size_t size() const = 0;
};

/**
 * Map-backed store. A transaction snapshots the map and rollback restores it.
 */
class InMemoryStore : public KeyValueStore {
public:
    InMemoryStore() = default;

    std::optional<nlohmann::json> get(const StorageKey& key) const override;
    void set(const StorageKey& key, const nlohmann::json& value) override;
    void remove(const StorageKey& key) override;

    void begin_transaction() override;
    void commit_transaction() override;
    void rollback_transaction() override;
    bool in_transaction() const override { return snapshot_.has_value(); }

    size_t size() const override { return entries_.size(); }

    // Raw contents keyed by encoded key (tests, dumps)
    const std::map<std::string, nlohmann::json>& entries() const { return entries_; }

private:
    std::map<std::string, nlohmann::json> entries_;
    std::optional<std::map<std::string, nlohmann::json>> snapshot_;
};

} // namespace pmkt
