#pragma once

#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace pmkt {

/**
 * The single active betting/prediction cycle.
 */
struct Round {
    uint32_t round_number{0};       // 1-based, increments per created round
    RoundMode mode{RoundMode::UP_DOWN};
    Price price_start{0};
    LedgerSeq start_ledger{0};      // Also the oracle correlation id
    LedgerSeq bet_end_ledger{0};    // Staking allowed while sequence < this
    LedgerSeq end_ledger{0};        // Resolution allowed once sequence >= this
    Amount pool_up{0};
    Amount pool_down{0};

    RoundPhase phase_at(LedgerSeq sequence) const {
        if (sequence < bet_end_ledger) return RoundPhase::OPEN;
        if (sequence < end_ledger) return RoundPhase::CLOSED;
        return RoundPhase::RESOLVABLE;
    }

    bool operator==(const Round& other) const = default;
};

/**
 * A user's Up/Down stake in the active round. Immutable once recorded.
 */
struct UserPosition {
    Amount amount{0};
    BetSide side{BetSide::UP};

    bool operator==(const UserPosition& other) const = default;
};

/**
 * A user's exact-price guess in a Precision round.
 */
struct PrecisionPrediction {
    Address user;
    Amount amount{0};
    uint32_t predicted_price{0};    // x10000 scaled, [1, 999999]

    bool operator==(const PrecisionPrediction& other) const = default;
};

/**
 * Per-user results across rounds.
 */
struct UserStats {
    uint32_t total_wins{0};
    uint32_t total_losses{0};
    uint32_t current_streak{0};
    uint32_t best_streak{0};

    bool operator==(const UserStats& other) const = default;
};

struct WindowConfig {
    LedgerSeq bet_ledgers{DEFAULT_BET_LEDGERS};
    LedgerSeq run_ledgers{DEFAULT_RUN_LEDGERS};
};

// Up/Down positions keyed by user; predictions in placement order
using PositionMap = std::map<Address, UserPosition>;
using PredictionList = std::vector<PrecisionPrediction>;

// JSON serialization. Wide integers are encoded as decimal strings.
void to_json(nlohmann::json& j, const Round& r);
void from_json(const nlohmann::json& j, Round& r);
void to_json(nlohmann::json& j, const UserPosition& p);
void from_json(const nlohmann::json& j, UserPosition& p);
void to_json(nlohmann::json& j, const PrecisionPrediction& p);
void from_json(const nlohmann::json& j, PrecisionPrediction& p);
void to_json(nlohmann::json& j, const UserStats& s);
void from_json(const nlohmann::json& j, UserStats& s);

// Mode/side parsing shared by the CLI and replay tool
RoundMode mode_from_code(uint32_t code);
BetSide side_from_string(const std::string& s);

} // namespace pmkt
