#include "market/prediction_market.hpp"
#include "utils/wide_int.hpp"
#include <stdexcept>

namespace pmkt {

namespace {

KeyValueStore& require_store(const std::shared_ptr<KeyValueStore>& store) {
    if (!store) {
        throw std::invalid_argument("PredictionMarket requires a store");
    }
    return *store;
}

} // anonymous namespace

PredictionMarket::PredictionMarket(std::shared_ptr<KeyValueStore> store, EventSinkPtr events)
    : store_(std::move(store)),
      events_(std::move(events)),
      state_(require_store(store_)),
      access_(state_),
      windows_(state_, access_),
      lifecycle_(state_, access_, windows_),
      ledger_(state_, access_),
      vault_(state_, access_, ledger_),
      stats_(state_),
      positions_(state_, access_, lifecycle_, ledger_),
      validator_(),
      settlement_(state_, access_, lifecycle_, validator_, vault_, stats_)
{
}

// ============================================================================
// Events
// ============================================================================

void PredictionMarket::emit(const std::string& type, const CallContext& ctx, nlohmann::json data) {
    pending_events_.push_back(MarketEvent{type, ctx.sequence, ctx.timestamp, std::move(data)});
}

void PredictionMarket::publish_pending() {
    std::vector<MarketEvent> events;
    events.swap(pending_events_);

    if (!events_) {
        return;
    }
    for (const auto& event : events) {
        events_->publish(event);
    }
}

// ============================================================================
// Administration
// ============================================================================

void PredictionMarket::initialize(const Address& admin, const Address& oracle,
                                  const CallContext& ctx) {
    atomically("initialize", [&] {
        access_.initialize(admin, oracle, ctx);
    });
}

void PredictionMarket::set_windows(LedgerSeq bet_ledgers, LedgerSeq run_ledgers,
                                   const CallContext& ctx) {
    atomically("set_windows", [&] {
        windows_.set_windows(bet_ledgers, run_ledgers, ctx);
    });
}

Round PredictionMarket::create_round(Price start_price, std::optional<uint32_t> mode,
                                     const CallContext& ctx) {
    return atomically("create_round", [&] {
        Round round = lifecycle_.create_round(start_price, mode, ctx);
        emit("round_created", ctx, round);
        return round;
    });
}

// ============================================================================
// Users
// ============================================================================

void PredictionMarket::place_bet(const Address& user, Amount amount, BetSide side,
                                 const CallContext& ctx) {
    atomically("place_bet", [&] {
        positions_.stake_updown(user, amount, side, ctx);
    });
}

void PredictionMarket::place_precision_prediction(const Address& user, Amount amount,
                                                  uint32_t predicted_price,
                                                  const CallContext& ctx) {
    atomically("place_precision_prediction", [&] {
        positions_.stake_precision(user, amount, predicted_price, ctx);
    });
}

void PredictionMarket::predict_price(const Address& user, uint32_t guessed_price, Amount amount,
                                     const CallContext& ctx) {
    place_precision_prediction(user, amount, guessed_price, ctx);
}

Amount PredictionMarket::claim_winnings(const Address& user, const CallContext& ctx) {
    return atomically("claim_winnings", [&] {
        Amount claimed = vault_.claim(user, ctx);
        if (claimed > 0) {
            emit("winnings_claimed", ctx, nlohmann::json{
                {"user", user},
                {"amount", amount_to_string(claimed)}
            });
        }
        return claimed;
    });
}

Amount PredictionMarket::mint_initial(const Address& user, const CallContext& ctx) {
    return atomically("mint_initial", [&] {
        return ledger_.mint_initial(user, ctx);
    });
}

// ============================================================================
// Oracle
// ============================================================================

SettlementSummary PredictionMarket::resolve_round(const OraclePayload& payload,
                                                  const CallContext& ctx) {
    return atomically("resolve_round", [&] {
        SettlementSummary summary = settlement_.resolve(payload, ctx);
        emit("round_resolved", ctx, summary);
        return summary;
    });
}

// ============================================================================
// Reads
// ============================================================================

std::optional<UserPosition> PredictionMarket::get_user_position(const Address& user) const {
    return positions_.position_of(user);
}

std::optional<PrecisionPrediction> PredictionMarket::get_user_precision_prediction(
    const Address& user) const {
    return positions_.prediction_of(user);
}

} // namespace pmkt
