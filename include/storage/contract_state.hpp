#pragma once

#include <optional>
#include "market/market_types.hpp"
#include "storage/key_value_store.hpp"

namespace pmkt {

/**
 * Typed view over the key/value store. This is the state object every
 * market component receives; it owns nothing and holds no cache, so all
 * reads observe the current transaction.
 */
class ContractState {
public:
    explicit ContractState(KeyValueStore& store) : store_(store) {}

    KeyValueStore& store() { return store_; }

    // Roles
    std::optional<Address> admin() const;
    std::optional<Address> oracle() const;
    void set_roles(const Address& admin, const Address& oracle);

    // Balances (default 0)
    bool has_balance(const Address& user) const;
    Amount balance(const Address& user) const;
    void set_balance(const Address& user, Amount amount);

    // Pending winnings (default 0); zero removes the entry
    Amount pending_winnings(const Address& user) const;
    void set_pending_winnings(const Address& user, Amount amount);

    // Stats (default all zero)
    UserStats user_stats(const Address& user) const;
    void set_user_stats(const Address& user, const UserStats& stats);

    // Active round
    std::optional<Round> active_round() const;
    void set_active_round(const Round& round);
    void clear_active_round();

    // Per-mode stake collections of the active round
    PositionMap updown_positions() const;
    void set_updown_positions(const PositionMap& positions);
    PredictionList precision_predictions() const;
    void set_precision_predictions(const PredictionList& predictions);
    void clear_positions();

    // Window configuration (defaults when unset)
    WindowConfig windows() const;
    void set_windows(const WindowConfig& windows);

    // Round counter (0 before the first round)
    uint32_t last_round_id() const;
    void set_last_round_id(uint32_t id);

private:
    KeyValueStore& store_;
};

} // namespace pmkt
