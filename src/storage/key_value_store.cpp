#include "storage/key_value_store.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pmkt {

std::optional<nlohmann::json> InMemoryStore::get(const StorageKey& key) const {
    auto it = entries_.find(encode_key(key));
    if (it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void InMemoryStore::set(const StorageKey& key, const nlohmann::json& value) {
    entries_[encode_key(key)] = value;
}

void InMemoryStore::remove(const StorageKey& key) {
    entries_.erase(encode_key(key));
}

void InMemoryStore::begin_transaction() {
    if (snapshot_) {
        throw std::logic_error("InMemoryStore: transaction already open");
    }
    snapshot_ = entries_;
}

void InMemoryStore::commit_transaction() {
    if (!snapshot_) {
        throw std::logic_error("InMemoryStore: commit without transaction");
    }
    snapshot_.reset();
}

void InMemoryStore::rollback_transaction() {
    if (!snapshot_) {
        throw std::logic_error("InMemoryStore: rollback without transaction");
    }
    entries_ = std::move(*snapshot_);
    snapshot_.reset();
    spdlog::debug("InMemoryStore rolled back to {} keys", entries_.size());
}

} // namespace pmkt
