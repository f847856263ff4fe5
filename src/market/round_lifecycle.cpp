#include "market/round_lifecycle.hpp"
#include "common/errors.hpp"
#include "utils/wide_int.hpp"
#include <limits>
#include <spdlog/spdlog.h>

namespace pmkt {

Round RoundLifecycle::create_round(Price start_price, std::optional<uint32_t> mode_code,
                                   const CallContext& ctx) {
    access_.require_admin(ctx);

    if (start_price == 0) {
        throw MarketError(ErrorCode::INVALID_PRICE, "start price is zero");
    }

    RoundMode mode = mode_from_code(mode_code.value_or(0));

    if (state_.active_round()) {
        throw MarketError(ErrorCode::ROUND_ALREADY_ACTIVE);
    }

    RoundMarkers markers = windows_.markers_for(ctx.sequence);

    uint32_t last_id = state_.last_round_id();
    if (last_id == std::numeric_limits<uint32_t>::max()) {
        throw MarketError(ErrorCode::OVERFLOW, "round counter");
    }

    Round round;
    round.round_number = last_id + 1;
    round.mode = mode;
    round.price_start = start_price;
    round.start_ledger = markers.start_ledger;
    round.bet_end_ledger = markers.bet_end_ledger;
    round.end_ledger = markers.end_ledger;

    state_.set_active_round(round);
    state_.set_last_round_id(round.round_number);
    state_.clear_positions();

    spdlog::info("Round #{} created: mode={} start_price={} ledgers [{}, bet_end={}, end={}]",
                 round.round_number, mode_to_string(mode), price_to_string(start_price),
                 round.start_ledger, round.bet_end_ledger, round.end_ledger);
    return round;
}

RoundPhase RoundLifecycle::phase(LedgerSeq sequence) const {
    auto round = state_.active_round();
    if (!round) return RoundPhase::IDLE;
    return round->phase_at(sequence);
}

Round RoundLifecycle::require_open(LedgerSeq sequence) const {
    auto round = state_.active_round();
    if (!round) {
        throw MarketError(ErrorCode::NO_ACTIVE_ROUND);
    }
    if (round->phase_at(sequence) != RoundPhase::OPEN) {
        throw MarketError(ErrorCode::ROUND_ENDED);
    }
    return *round;
}

Round RoundLifecycle::require_resolvable(LedgerSeq sequence) const {
    auto round = state_.active_round();
    if (!round) {
        throw MarketError(ErrorCode::NO_ACTIVE_ROUND);
    }
    if (round->phase_at(sequence) != RoundPhase::RESOLVABLE) {
        throw MarketError(ErrorCode::ROUND_NOT_ENDED,
                          "resolvable at ledger " + std::to_string(round->end_ledger));
    }
    return *round;
}

void RoundLifecycle::finish_round() {
    state_.clear_active_round();
    state_.clear_positions();
}

} // namespace pmkt
