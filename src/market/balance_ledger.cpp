#include "market/balance_ledger.hpp"
#include "common/errors.hpp"
#include "utils/checked_math.hpp"
#include "utils/wide_int.hpp"
#include <spdlog/spdlog.h>

namespace pmkt {

Amount BalanceLedger::mint_initial(const Address& user, const CallContext& ctx) {
    access_.require_user(user, ctx);

    if (state_.has_balance(user)) {
        return state_.balance(user);
    }

    state_.set_balance(user, INITIAL_MINT);
    spdlog::info("Minted initial balance {} for {}", amount_to_string(INITIAL_MINT), user);
    return INITIAL_MINT;
}

Amount BalanceLedger::debit(const Address& user, Amount amount) {
    Amount current = state_.balance(user);
    if (amount < 0 || current < amount) {
        throw MarketError(ErrorCode::INSUFFICIENT_BALANCE,
                          user + " has " + amount_to_string(current));
    }
    Amount updated = checked_sub(current, amount);
    state_.set_balance(user, updated);
    return updated;
}

Amount BalanceLedger::credit(const Address& user, Amount amount) {
    Amount updated = checked_add(state_.balance(user), amount);
    state_.set_balance(user, updated);
    return updated;
}

void PendingWinningsVault::credit(const Address& user, Amount amount) {
    Amount updated = checked_add(state_.pending_winnings(user), amount);
    state_.set_pending_winnings(user, updated);
}

Amount PendingWinningsVault::claim(const Address& user, const CallContext& ctx) {
    access_.require_user(user, ctx);

    Amount pending = state_.pending_winnings(user);
    if (pending == 0) {
        return 0;
    }

    ledger_.credit(user, pending);
    state_.set_pending_winnings(user, 0);

    spdlog::info("{} claimed {}", user, amount_to_string(pending));
    return pending;
}

} // namespace pmkt
