#include "position/position_book.hpp"
#include "common/errors.hpp"
#include "utils/checked_math.hpp"
#include "utils/wide_int.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pmkt {

Round PositionBook::require_mode(RoundMode mode, LedgerSeq sequence) const {
    Round round = lifecycle_.require_open(sequence);
    if (round.mode != mode) {
        throw MarketError(ErrorCode::WRONG_MODE_FOR_PREDICTION,
                          "round #" + std::to_string(round.round_number) + " is " +
                          mode_to_string(round.mode));
    }
    return round;
}

Round PositionBook::stake_updown(const Address& user, Amount amount, BetSide side,
                                 const CallContext& ctx) {
    access_.require_user(user, ctx);

    if (amount <= 0) {
        throw MarketError(ErrorCode::INVALID_BET_AMOUNT);
    }

    Round round = require_mode(RoundMode::UP_DOWN, ctx.sequence);

    PositionMap positions = state_.updown_positions();
    if (positions.count(user) > 0) {
        throw MarketError(ErrorCode::ALREADY_BET, user);
    }

    // Pool overflow is checked before the debit
    if (side == BetSide::UP) {
        round.pool_up = checked_add(round.pool_up, amount);
    } else {
        round.pool_down = checked_add(round.pool_down, amount);
    }

    ledger_.debit(user, amount);

    positions[user] = UserPosition{amount, side};
    state_.set_updown_positions(positions);
    state_.set_active_round(round);

    spdlog::debug("Stake accepted: round #{} {} {} {} (pool_up={} pool_down={})",
                  round.round_number, user, side_to_string(side), amount_to_string(amount),
                  amount_to_string(round.pool_up), amount_to_string(round.pool_down));
    return round;
}

PrecisionPrediction PositionBook::stake_precision(const Address& user, Amount amount,
                                                  uint32_t predicted_price,
                                                  const CallContext& ctx) {
    access_.require_user(user, ctx);

    if (amount <= 0) {
        throw MarketError(ErrorCode::INVALID_BET_AMOUNT);
    }
    if (!valid_precision_price(predicted_price)) {
        throw MarketError(ErrorCode::INVALID_PRICE_SCALE,
                          std::to_string(predicted_price) + " outside [1, 999999]");
    }

    Round round = require_mode(RoundMode::PRECISION, ctx.sequence);

    PredictionList predictions = state_.precision_predictions();
    bool already = std::any_of(predictions.begin(), predictions.end(),
                               [&](const PrecisionPrediction& p) { return p.user == user; });
    if (already) {
        throw MarketError(ErrorCode::ALREADY_BET, user);
    }

    ledger_.debit(user, amount);

    PrecisionPrediction prediction{user, amount, predicted_price};
    predictions.push_back(prediction);
    state_.set_precision_predictions(predictions);

    spdlog::debug("Prediction accepted: round #{} {} guess={} amount={}",
                  round.round_number, user, format_scaled_price(predicted_price),
                  amount_to_string(amount));
    return prediction;
}

std::optional<UserPosition> PositionBook::position_of(const Address& user) const {
    PositionMap positions = state_.updown_positions();
    auto it = positions.find(user);
    if (it != positions.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<PrecisionPrediction> PositionBook::prediction_of(const Address& user) const {
    for (const auto& p : state_.precision_predictions()) {
        if (p.user == user) {
            return p;
        }
    }
    return std::nullopt;
}

} // namespace pmkt
