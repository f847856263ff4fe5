#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "market/access_controller.hpp"
#include "market/balance_ledger.hpp"
#include "market/round_lifecycle.hpp"
#include "market/stats_tracker.hpp"
#include "oracle/oracle_validator.hpp"
#include "storage/contract_state.hpp"

namespace pmkt {

// ============================================================================
// SETTLEMENT ENGINE
//
// Resolves the active round against an oracle observation and credits
// pending winnings.
//
// Up/Down:   payout = stake + floor(stake * losing_pool / winning_pool)
//            Equal price, or a side with no stake, refunds every stake.
// Precision: winners are all predictions closest to the observed price;
//            each receives floor(total_pot / winner_count).
//
// Truncated remainders are not distributed; they are reported as
// `undistributed` in the summary.
// ============================================================================

enum class SettlementOutcome {
    UP_WON,
    DOWN_WON,
    REFUND_TIE,          // Price unchanged
    REFUND_ONE_SIDED,    // One side had no stake
    PRECISION_WINNERS,
    NO_STAKES
};

std::string outcome_to_string(SettlementOutcome o);

struct Payout {
    Address user;
    Amount amount{0};
    bool winner{false};     // false for refunds
};

struct SettlementSummary {
    uint32_t round_number{0};
    RoundMode mode{RoundMode::UP_DOWN};
    Price price_start{0};
    Price final_price{0};
    SettlementOutcome outcome{SettlementOutcome::NO_STAKES};

    std::vector<Payout> payouts;
    std::vector<Address> losers;

    Amount total_staked{0};
    Amount total_paid{0};
    Amount undistributed{0};   // total_staked - total_paid

    size_t winner_count() const;
};

void to_json(nlohmann::json& j, const SettlementSummary& s);

class SettlementEngine {
public:
    SettlementEngine(ContractState& state,
                     const AccessController& access,
                     RoundLifecycle& lifecycle,
                     const OracleValidator& validator,
                     PendingWinningsVault& vault,
                     StatsTracker& stats)
        : state_(state), access_(access), lifecycle_(lifecycle),
          validator_(validator), vault_(vault), stats_(stats) {}

    // Oracle only. Requires a resolvable round and a valid payload.
    SettlementSummary resolve(const OraclePayload& payload, const CallContext& ctx);

private:
    ContractState& state_;
    const AccessController& access_;
    RoundLifecycle& lifecycle_;
    const OracleValidator& validator_;
    PendingWinningsVault& vault_;
    StatsTracker& stats_;

    void settle_updown(const Round& round, SettlementSummary& summary);
    void settle_precision(const Round& round, SettlementSummary& summary);

    void refund_all(const PositionMap& positions, SettlementSummary& summary);
    void credit(const Address& user, Amount amount, bool winner, SettlementSummary& summary);
};

} // namespace pmkt
