#pragma once

#include "storage/contract_state.hpp"

namespace pmkt {

// Win/loss/streak counters per user. Counters saturate instead of wrapping.
class StatsTracker {
public:
    explicit StatsTracker(ContractState& state) : state_(state) {}

    UserStats get(const Address& user) const { return state_.user_stats(user); }

    void record_win(const Address& user);
    void record_loss(const Address& user);

private:
    ContractState& state_;
};

} // namespace pmkt
