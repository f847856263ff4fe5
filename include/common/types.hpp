#pragma once

#include <string>
#include <set>
#include <optional>
#include <cstdint>

namespace pmkt {

// Principal identifier (account address)
using Address = std::string;

// Wide integer types. Amounts are signed, prices unsigned.
using Amount = __int128;
using Price = unsigned __int128;

// Ledger sequence number and ledger close time (seconds)
using LedgerSeq = uint32_t;
using LedgerTime = uint64_t;

// Starting balance minted once per user (1000 units at 7 decimals)
constexpr Amount INITIAL_MINT = static_cast<Amount>(1000) * 10'000'000;

// Default window lengths in ledgers
constexpr LedgerSeq DEFAULT_BET_LEDGERS = 6;
constexpr LedgerSeq DEFAULT_RUN_LEDGERS = 12;

// Oracle freshness window in seconds
constexpr LedgerTime ORACLE_MAX_AGE_SECONDS = 300;

// Precision predictions are scaled x10000 (4 decimal digits)
constexpr uint32_t PRECISION_SCALE = 10'000;
constexpr uint32_t MIN_PRECISION_PRICE = 1;
constexpr uint32_t MAX_PRECISION_PRICE = 999'999;

// Round mode
enum class RoundMode {
    UP_DOWN,    // Bet on direction relative to the start price
    PRECISION   // Guess the exact resolving price
};

inline std::string mode_to_string(RoundMode m) {
    switch (m) {
        case RoundMode::UP_DOWN: return "UP_DOWN";
        case RoundMode::PRECISION: return "PRECISION";
    }
    return "UNKNOWN";
}

// Wire value of the mode (0 = UpDown, 1 = Precision)
inline uint32_t mode_to_code(RoundMode m) {
    return m == RoundMode::PRECISION ? 1u : 0u;
}

// Side of an Up/Down position
enum class BetSide {
    UP,
    DOWN
};

inline std::string side_to_string(BetSide s) {
    return s == BetSide::UP ? "UP" : "DOWN";
}

// Round phase as seen from a given ledger sequence
enum class RoundPhase {
    IDLE,          // No active round
    OPEN,          // Staking allowed
    CLOSED,        // Betting closed, waiting for end ledger
    RESOLVABLE     // Oracle may resolve
};

inline std::string phase_to_string(RoundPhase p) {
    switch (p) {
        case RoundPhase::IDLE: return "IDLE";
        case RoundPhase::OPEN: return "OPEN";
        case RoundPhase::CLOSED: return "CLOSED";
        case RoundPhase::RESOLVABLE: return "RESOLVABLE";
    }
    return "UNKNOWN";
}

/**
 * Host-supplied context of one invocation: who authorized it and
 * the ledger it executes in.
 */
struct CallContext {
    std::set<Address> signers;   // Principals that authorized this call
    LedgerSeq sequence{0};
    LedgerTime timestamp{0};

    bool authorized_by(const Address& principal) const {
        return signers.count(principal) > 0;
    }

    static CallContext signed_by(const Address& principal, LedgerSeq seq = 0,
                                 LedgerTime ts = 0) {
        CallContext ctx;
        ctx.signers.insert(principal);
        ctx.sequence = seq;
        ctx.timestamp = ts;
        return ctx;
    }
};

} // namespace pmkt
