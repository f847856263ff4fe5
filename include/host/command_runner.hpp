#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market/prediction_market.hpp"

namespace pmkt {

/**
 * Simulated ledger clock owned by the host. The market never advances it.
 */
struct LedgerClock {
    LedgerSeq sequence{1};
    LedgerTime timestamp{0};
    LedgerTime seconds_per_ledger{5};

    // Move forward by `ledgers`; time advances by `seconds` if given,
    // otherwise by ledgers * seconds_per_ledger
    void advance(LedgerSeq ledgers, std::optional<LedgerTime> seconds = std::nullopt);
};

/**
 * Executes market operations described as JSON documents:
 *
 *   {"op": "place_bet", "user": "alice", "amount": "100", "side": "up"}
 *
 * Optional fields on every command:
 *   "caller"     string or array of principals authorizing the call.
 *                Defaults to "user" for user operations and to "admin"
 *                for initialize; other operations default to no signer.
 *   "ledger"     sequence for this command only
 *   "timestamp"  ledger close time for this command only
 *
 * resolve_round takes the oracle observation time as "observed_at".
 *
 * Wide integers are accepted as JSON integers or decimal strings and
 * returned as decimal strings.
 */
class CommandRunner {
public:
    explicit CommandRunner(PredictionMarket& market, LedgerClock clock = {})
        : market_(market), clock_(clock) {}

    // Throws MarketError for rejected operations and std::invalid_argument
    // for malformed commands
    nlohmann::json execute(const nlohmann::json& command);

    const LedgerClock& clock() const { return clock_; }
    LedgerClock& clock() { return clock_; }

    static const std::vector<std::string>& operations();

private:
    PredictionMarket& market_;
    LedgerClock clock_;

    CallContext context_for(const nlohmann::json& command, const std::string& default_signer) const;
};

// Field readers for command documents
std::string string_field(const nlohmann::json& command, const char* name);
Amount amount_field(const nlohmann::json& command, const char* name);
Price price_field(const nlohmann::json& command, const char* name);

} // namespace pmkt
