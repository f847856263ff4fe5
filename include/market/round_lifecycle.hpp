#pragma once

#include <optional>
#include "market/access_controller.hpp"
#include "market/market_types.hpp"
#include "market/window_policy.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

/**
 * Round state machine:
 *
 *   IDLE --create_round--> OPEN --bet_end--> CLOSED --end--> RESOLVABLE
 *     ^                                                          |
 *     +------------------------ finish_round --------------------+
 *
 * Phases other than IDLE are derived from the ledger sequence of the call.
 */
class RoundLifecycle {
public:
    RoundLifecycle(ContractState& state, const AccessController& access,
                   const WindowPolicy& windows)
        : state_(state), access_(access), windows_(windows) {}

    // Admin only. `mode_code` absent means Up/Down.
    Round create_round(Price start_price, std::optional<uint32_t> mode_code,
                       const CallContext& ctx);

    std::optional<Round> active_round() const { return state_.active_round(); }
    RoundPhase phase(LedgerSeq sequence) const;
    uint32_t last_round_id() const { return state_.last_round_id(); }

    // Gates. Each returns the active round or throws the matching error.
    Round require_open(LedgerSeq sequence) const;
    Round require_resolvable(LedgerSeq sequence) const;

    // Retire the active round and all of its stake records
    void finish_round();

private:
    ContractState& state_;
    const AccessController& access_;
    const WindowPolicy& windows_;
};

} // namespace pmkt
