#include "oracle/oracle_validator.hpp"
#include "common/errors.hpp"
#include "utils/wide_int.hpp"
#include <stdexcept>

namespace pmkt {

void to_json(nlohmann::json& j, const OraclePayload& p) {
    j = nlohmann::json{
        {"price", price_to_string(p.price)},
        {"timestamp", p.timestamp},
        {"round_id", p.round_id}
    };
}

void from_json(const nlohmann::json& j, OraclePayload& p) {
    const auto& price = j.at("price");
    if (price.is_string()) {
        p.price = parse_price(price.get<std::string>());
    } else if (price.is_number_integer() && (price.is_number_unsigned() || price.get<int64_t>() >= 0)) {
        p.price = price.get<uint64_t>();
    } else {
        throw std::invalid_argument("oracle price must be a non-negative integer");
    }
    j.at("timestamp").get_to(p.timestamp);
    j.at("round_id").get_to(p.round_id);
}

bool OracleValidator::is_stale(LedgerTime observed_at, LedgerTime now) const {
    // now > observed_at + max_age, without wrapping the addition
    if (now <= observed_at) return false;
    return now - observed_at > max_age_seconds_;
}

void OracleValidator::validate(const OraclePayload& payload, const Round& round,
                               LedgerTime now) const {
    if (payload.price == 0) {
        throw MarketError(ErrorCode::INVALID_PRICE, "oracle price is zero");
    }

    if (payload.round_id != round.start_ledger) {
        throw MarketError(ErrorCode::INVALID_ORACLE_ROUND,
                          "payload round " + std::to_string(payload.round_id) +
                          " != active round " + std::to_string(round.start_ledger));
    }

    if (is_stale(payload.timestamp, now)) {
        throw MarketError(ErrorCode::STALE_ORACLE_DATA,
                          "observed at " + std::to_string(payload.timestamp) +
                          ", now " + std::to_string(now));
    }
}

} // namespace pmkt
