#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "common/types.hpp"
#include "events/event_sink.hpp"
#include "market/access_controller.hpp"
#include "market/balance_ledger.hpp"
#include "market/market_types.hpp"
#include "market/round_lifecycle.hpp"
#include "market/stats_tracker.hpp"
#include "market/window_policy.hpp"
#include "oracle/oracle_validator.hpp"
#include "position/position_book.hpp"
#include "settlement/settlement_engine.hpp"
#include "storage/contract_state.hpp"
#include "storage/key_value_store.hpp"

namespace pmkt {

/**
 * The market's external surface.
 *
 * Every mutating operation runs as one store transaction: it either
 * commits all of its writes or throws MarketError after rolling all of
 * them back. Events are published only after commit.
 */
class PredictionMarket {
public:
    explicit PredictionMarket(std::shared_ptr<KeyValueStore> store,
                              EventSinkPtr events = nullptr);

    // Non-copyable (components hold references into this object)
    PredictionMarket(const PredictionMarket&) = delete;
    PredictionMarket& operator=(const PredictionMarket&) = delete;

    // ========================================================================
    // Administration
    // ========================================================================

    void initialize(const Address& admin, const Address& oracle, const CallContext& ctx);
    void set_windows(LedgerSeq bet_ledgers, LedgerSeq run_ledgers, const CallContext& ctx);
    Round create_round(Price start_price, std::optional<uint32_t> mode, const CallContext& ctx);

    // ========================================================================
    // Users
    // ========================================================================

    void place_bet(const Address& user, Amount amount, BetSide side, const CallContext& ctx);
    void place_precision_prediction(const Address& user, Amount amount,
                                    uint32_t predicted_price, const CallContext& ctx);
    // Same as place_precision_prediction with the price first
    void predict_price(const Address& user, uint32_t guessed_price, Amount amount,
                       const CallContext& ctx);

    Amount claim_winnings(const Address& user, const CallContext& ctx);
    Amount mint_initial(const Address& user, const CallContext& ctx);

    // ========================================================================
    // Oracle
    // ========================================================================

    SettlementSummary resolve_round(const OraclePayload& payload, const CallContext& ctx);

    // ========================================================================
    // Reads
    // ========================================================================

    std::optional<Address> get_admin() const { return state_.admin(); }
    std::optional<Address> get_oracle() const { return state_.oracle(); }
    std::optional<Round> get_active_round() const { return state_.active_round(); }
    UserStats get_user_stats(const Address& user) const { return stats_.get(user); }
    Amount get_pending_winnings(const Address& user) const { return vault_.pending(user); }
    std::optional<UserPosition> get_user_position(const Address& user) const;
    std::optional<PrecisionPrediction> get_user_precision_prediction(const Address& user) const;
    PredictionList get_precision_predictions() const { return positions_.precision_predictions(); }
    PositionMap get_updown_positions() const { return positions_.updown_positions(); }
    Amount balance(const Address& user) const { return ledger_.balance(user); }

    uint32_t get_last_round_id() const { return lifecycle_.last_round_id(); }
    WindowConfig get_windows() const { return windows_.current(); }
    RoundPhase get_round_phase(LedgerSeq sequence) const { return lifecycle_.phase(sequence); }

private:
    std::shared_ptr<KeyValueStore> store_;
    EventSinkPtr events_;

    ContractState state_;
    AccessController access_;
    WindowPolicy windows_;
    RoundLifecycle lifecycle_;
    BalanceLedger ledger_;
    PendingWinningsVault vault_;
    StatsTracker stats_;
    PositionBook positions_;
    OracleValidator validator_;
    SettlementEngine settlement_;

    std::vector<MarketEvent> pending_events_;

    void emit(const std::string& type, const CallContext& ctx, nlohmann::json data);
    void publish_pending();

    // Run `fn` inside a store transaction; roll back and rethrow on error
    template <typename Fn>
    auto atomically(const char* operation, Fn&& fn) -> decltype(fn()) {
        pending_events_.clear();
        store_->begin_transaction();
        try {
            if constexpr (std::is_void_v<decltype(fn())>) {
                fn();
                store_->commit_transaction();
                publish_pending();
            } else {
                auto result = fn();
                store_->commit_transaction();
                publish_pending();
                return result;
            }
        } catch (const MarketError& e) {
            store_->rollback_transaction();
            pending_events_.clear();
            spdlog::warn("{} rejected: {}", operation, e.what());
            throw;
        } catch (const std::exception& e) {
            if (store_->in_transaction()) {
                store_->rollback_transaction();
            }
            pending_events_.clear();
            spdlog::error("{} failed: {}", operation, e.what());
            throw;
        }
    }
};

} // namespace pmkt
