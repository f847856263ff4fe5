#pragma once

#include "market/access_controller.hpp"
#include "market/market_types.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

// Ledger markers derived from a start ledger and the window config
struct RoundMarkers {
    LedgerSeq start_ledger{0};
    LedgerSeq bet_end_ledger{0};
    LedgerSeq end_ledger{0};
};

/**
 * Betting and run window lengths, in ledgers.
 */
class WindowPolicy {
public:
    WindowPolicy(ContractState& state, const AccessController& access)
        : state_(state), access_(access) {}

    // Admin only. Requires 0 < bet_ledgers < run_ledgers.
    void set_windows(LedgerSeq bet_ledgers, LedgerSeq run_ledgers, const CallContext& ctx);

    WindowConfig current() const { return state_.windows(); }

    // Compute the markers of a round starting at `start` (overflow checked)
    RoundMarkers markers_for(LedgerSeq start) const;

    static void validate(LedgerSeq bet_ledgers, LedgerSeq run_ledgers);

private:
    ContractState& state_;
    const AccessController& access_;
};

} // namespace pmkt
