#pragma once

#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market/market_types.hpp"

namespace pmkt {

/**
 * Price observation submitted by the oracle to resolve a round.
 * `round_id` must equal the active round's start ledger.
 */
struct OraclePayload {
    Price price{0};
    LedgerTime timestamp{0};
    LedgerSeq round_id{0};
};

void to_json(nlohmann::json& j, const OraclePayload& p);
void from_json(const nlohmann::json& j, OraclePayload& p);

/**
 * Stateless precondition checks on an oracle payload.
 */
class OracleValidator {
public:
    explicit OracleValidator(LedgerTime max_age_seconds = ORACLE_MAX_AGE_SECONDS)
        : max_age_seconds_(max_age_seconds) {}

    // Throws INVALID_PRICE, INVALID_ORACLE_ROUND or STALE_ORACLE_DATA
    void validate(const OraclePayload& payload, const Round& round, LedgerTime now) const;

    bool is_stale(LedgerTime observed_at, LedgerTime now) const;

    LedgerTime max_age_seconds() const { return max_age_seconds_; }

private:
    LedgerTime max_age_seconds_;
};

} // namespace pmkt
