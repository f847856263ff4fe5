#pragma once

#include "market/access_controller.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

/**
 * Per-account fungible balance.
 */
class BalanceLedger {
public:
    BalanceLedger(ContractState& state, const AccessController& access)
        : state_(state), access_(access) {}

    // Credit INITIAL_MINT on first touch; later calls return the
    // existing balance unchanged
    Amount mint_initial(const Address& user, const CallContext& ctx);

    Amount balance(const Address& user) const { return state_.balance(user); }

    // Throws INSUFFICIENT_BALANCE if amount exceeds the balance
    Amount debit(const Address& user, Amount amount);
    Amount credit(const Address& user, Amount amount);

private:
    ContractState& state_;
    const AccessController& access_;
};

/**
 * Claimable winnings, held apart from balances until the user claims.
 */
class PendingWinningsVault {
public:
    PendingWinningsVault(ContractState& state, const AccessController& access,
                         BalanceLedger& ledger)
        : state_(state), access_(access), ledger_(ledger) {}

    Amount pending(const Address& user) const { return state_.pending_winnings(user); }

    // Accumulate a settlement credit
    void credit(const Address& user, Amount amount);

    // Move everything pending into the balance. Returns the claimed amount.
    Amount claim(const Address& user, const CallContext& ctx);

private:
    ContractState& state_;
    const AccessController& access_;
    BalanceLedger& ledger_;
};

} // namespace pmkt
