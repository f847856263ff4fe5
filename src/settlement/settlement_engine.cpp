#include "settlement/settlement_engine.hpp"
#include "common/errors.hpp"
#include "utils/checked_math.hpp"
#include "utils/wide_int.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pmkt {

std::string outcome_to_string(SettlementOutcome o) {
    switch (o) {
        case SettlementOutcome::UP_WON: return "UP_WON";
        case SettlementOutcome::DOWN_WON: return "DOWN_WON";
        case SettlementOutcome::REFUND_TIE: return "REFUND_TIE";
        case SettlementOutcome::REFUND_ONE_SIDED: return "REFUND_ONE_SIDED";
        case SettlementOutcome::PRECISION_WINNERS: return "PRECISION_WINNERS";
        case SettlementOutcome::NO_STAKES: return "NO_STAKES";
    }
    return "UNKNOWN";
}

size_t SettlementSummary::winner_count() const {
    return static_cast<size_t>(std::count_if(payouts.begin(), payouts.end(),
                                             [](const Payout& p) { return p.winner; }));
}

void to_json(nlohmann::json& j, const SettlementSummary& s) {
    nlohmann::json payouts = nlohmann::json::array();
    for (const auto& p : s.payouts) {
        payouts.push_back(nlohmann::json{
            {"user", p.user},
            {"amount", amount_to_string(p.amount)},
            {"winner", p.winner}
        });
    }

    j = nlohmann::json{
        {"round_number", s.round_number},
        {"mode", mode_to_string(s.mode)},
        {"price_start", price_to_string(s.price_start)},
        {"price", price_to_string(s.final_price)},
        {"outcome", outcome_to_string(s.outcome)},
        {"payouts", payouts},
        {"losers", s.losers},
        {"total_staked", amount_to_string(s.total_staked)},
        {"total_paid", amount_to_string(s.total_paid)},
        {"undistributed", amount_to_string(s.undistributed)}
    };
}

SettlementSummary SettlementEngine::resolve(const OraclePayload& payload, const CallContext& ctx) {
    access_.require_oracle(ctx);

    Round round = lifecycle_.require_resolvable(ctx.sequence);
    validator_.validate(payload, round, ctx.timestamp);

    SettlementSummary summary;
    summary.round_number = round.round_number;
    summary.mode = round.mode;
    summary.price_start = round.price_start;
    summary.final_price = payload.price;

    switch (round.mode) {
        case RoundMode::UP_DOWN:
            settle_updown(round, summary);
            break;
        case RoundMode::PRECISION:
            settle_precision(round, summary);
            break;
    }

    summary.undistributed = checked_sub(summary.total_staked, summary.total_paid);

    lifecycle_.finish_round();

    spdlog::info("Round #{} resolved: {} price={} staked={} paid={} winners={} losers={}",
                 summary.round_number, outcome_to_string(summary.outcome),
                 price_to_string(summary.final_price), amount_to_string(summary.total_staked),
                 amount_to_string(summary.total_paid), summary.winner_count(),
                 summary.losers.size());
    if (summary.undistributed > 0) {
        spdlog::info("Round #{} left {} undistributed after integer division",
                     summary.round_number, amount_to_string(summary.undistributed));
    }
    return summary;
}

void SettlementEngine::credit(const Address& user, Amount amount, bool winner,
                              SettlementSummary& summary) {
    vault_.credit(user, amount);
    summary.total_paid = checked_add(summary.total_paid, amount);
    summary.payouts.push_back(Payout{user, amount, winner});
}

void SettlementEngine::refund_all(const PositionMap& positions, SettlementSummary& summary) {
    for (const auto& [user, position] : positions) {
        credit(user, position.amount, false, summary);
    }
}

// ============================================================================
// UP/DOWN
// ============================================================================

void SettlementEngine::settle_updown(const Round& round, SettlementSummary& summary) {
    PositionMap positions = state_.updown_positions();

    for (const auto& [user, position] : positions) {
        summary.total_staked = checked_add(summary.total_staked, position.amount);
    }

    if (positions.empty()) {
        summary.outcome = SettlementOutcome::NO_STAKES;
        return;
    }

    if (summary.final_price == round.price_start) {
        summary.outcome = SettlementOutcome::REFUND_TIE;
        refund_all(positions, summary);
        return;
    }

    BetSide winning_side = summary.final_price > round.price_start ? BetSide::UP : BetSide::DOWN;
    Amount winning_pool = winning_side == BetSide::UP ? round.pool_up : round.pool_down;
    Amount losing_pool = winning_side == BetSide::UP ? round.pool_down : round.pool_up;

    // Nobody to pay or nobody to take from
    if (winning_pool == 0 || losing_pool == 0) {
        summary.outcome = SettlementOutcome::REFUND_ONE_SIDED;
        refund_all(positions, summary);
        return;
    }

    summary.outcome = winning_side == BetSide::UP ? SettlementOutcome::UP_WON
                                                   : SettlementOutcome::DOWN_WON;

    for (const auto& [user, position] : positions) {
        if (position.side == winning_side) {
            Amount share = checked_mul(position.amount, losing_pool) / winning_pool;
            Amount payout = checked_add(position.amount, share);
            credit(user, payout, true, summary);
            stats_.record_win(user);
        } else {
            summary.losers.push_back(user);
            stats_.record_loss(user);
        }
    }
}

// ============================================================================
// PRECISION
// ============================================================================

void SettlementEngine::settle_precision(const Round& round, SettlementSummary& summary) {
    PredictionList predictions = state_.precision_predictions();

    if (predictions.empty()) {
        summary.outcome = SettlementOutcome::NO_STAKES;
        return;
    }

    summary.outcome = SettlementOutcome::PRECISION_WINNERS;

    Price best = abs_diff(predictions.front().predicted_price, summary.final_price);
    for (const auto& p : predictions) {
        summary.total_staked = checked_add(summary.total_staked, p.amount);
        best = std::min(best, abs_diff(p.predicted_price, summary.final_price));
    }

    Amount winner_count = std::count_if(
        predictions.begin(), predictions.end(), [&](const PrecisionPrediction& p) {
            return abs_diff(p.predicted_price, summary.final_price) == best;
        });
    Amount per_winner = summary.total_staked / winner_count;

    spdlog::debug("Round #{} closest distance {} shared by {} predictions",
                  round.round_number, price_to_string(best), amount_to_string(winner_count));

    for (const auto& p : predictions) {
        if (abs_diff(p.predicted_price, summary.final_price) == best) {
            credit(p.user, per_winner, true, summary);
            stats_.record_win(p.user);
        } else {
            summary.losers.push_back(p.user);
            stats_.record_loss(p.user);
        }
    }
}

} // namespace pmkt
