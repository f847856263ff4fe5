#pragma once

#include <optional>
#include <vector>
#include "market/access_controller.hpp"
#include "market/balance_ledger.hpp"
#include "market/round_lifecycle.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

/**
 * Stakes of the active round, kept in two disjoint books: Up/Down
 * positions and Precision predictions. A user holds at most one stake
 * per round.
 */
class PositionBook {
public:
    PositionBook(ContractState& state, const AccessController& access,
                 const RoundLifecycle& lifecycle, BalanceLedger& ledger)
        : state_(state), access_(access), lifecycle_(lifecycle), ledger_(ledger) {}

    // Record an Up/Down stake. Debits the balance and credits the side pool.
    Round stake_updown(const Address& user, Amount amount, BetSide side,
                       const CallContext& ctx);

    // Record a Precision prediction (price scaled x10000)
    PrecisionPrediction stake_precision(const Address& user, Amount amount,
                                        uint32_t predicted_price, const CallContext& ctx);

    // Queries over the active round
    std::optional<UserPosition> position_of(const Address& user) const;
    std::optional<PrecisionPrediction> prediction_of(const Address& user) const;
    PositionMap updown_positions() const { return state_.updown_positions(); }
    PredictionList precision_predictions() const { return state_.precision_predictions(); }

    static bool valid_precision_price(uint32_t predicted_price) {
        return predicted_price >= MIN_PRECISION_PRICE && predicted_price <= MAX_PRECISION_PRICE;
    }

private:
    ContractState& state_;
    const AccessController& access_;
    const RoundLifecycle& lifecycle_;
    BalanceLedger& ledger_;

    Round require_mode(RoundMode mode, LedgerSeq sequence) const;
};

} // namespace pmkt
