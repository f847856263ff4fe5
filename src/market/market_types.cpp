#include "market/market_types.hpp"
#include "common/errors.hpp"
#include "utils/wide_int.hpp"
#include <stdexcept>

namespace pmkt {

void to_json(nlohmann::json& j, const Round& r) {
    j = nlohmann::json{
        {"round_number", r.round_number},
        {"mode", mode_to_code(r.mode)},
        {"price_start", price_to_string(r.price_start)},
        {"start_ledger", r.start_ledger},
        {"bet_end_ledger", r.bet_end_ledger},
        {"end_ledger", r.end_ledger},
        {"pool_up", amount_to_string(r.pool_up)},
        {"pool_down", amount_to_string(r.pool_down)}
    };
}

void from_json(const nlohmann::json& j, Round& r) {
    j.at("round_number").get_to(r.round_number);
    r.mode = mode_from_code(j.at("mode").get<uint32_t>());
    r.price_start = parse_price(j.at("price_start").get<std::string>());
    j.at("start_ledger").get_to(r.start_ledger);
    j.at("bet_end_ledger").get_to(r.bet_end_ledger);
    j.at("end_ledger").get_to(r.end_ledger);
    r.pool_up = parse_amount(j.at("pool_up").get<std::string>());
    r.pool_down = parse_amount(j.at("pool_down").get<std::string>());
}

void to_json(nlohmann::json& j, const UserPosition& p) {
    j = nlohmann::json{
        {"amount", amount_to_string(p.amount)},
        {"side", side_to_string(p.side)}
    };
}

void from_json(const nlohmann::json& j, UserPosition& p) {
    p.amount = parse_amount(j.at("amount").get<std::string>());
    p.side = side_from_string(j.at("side").get<std::string>());
}

void to_json(nlohmann::json& j, const PrecisionPrediction& p) {
    j = nlohmann::json{
        {"user", p.user},
        {"amount", amount_to_string(p.amount)},
        {"predicted_price", p.predicted_price}
    };
}

void from_json(const nlohmann::json& j, PrecisionPrediction& p) {
    j.at("user").get_to(p.user);
    p.amount = parse_amount(j.at("amount").get<std::string>());
    j.at("predicted_price").get_to(p.predicted_price);
}

void to_json(nlohmann::json& j, const UserStats& s) {
    j = nlohmann::json{
        {"total_wins", s.total_wins},
        {"total_losses", s.total_losses},
        {"current_streak", s.current_streak},
        {"best_streak", s.best_streak}
    };
}

void from_json(const nlohmann::json& j, UserStats& s) {
    if (j.contains("total_wins")) j.at("total_wins").get_to(s.total_wins);
    if (j.contains("total_losses")) j.at("total_losses").get_to(s.total_losses);
    if (j.contains("current_streak")) j.at("current_streak").get_to(s.current_streak);
    if (j.contains("best_streak")) j.at("best_streak").get_to(s.best_streak);
}

RoundMode mode_from_code(uint32_t code) {
    switch (code) {
        case 0: return RoundMode::UP_DOWN;
        case 1: return RoundMode::PRECISION;
    }
    throw MarketError(ErrorCode::INVALID_MODE, "mode " + std::to_string(code));
}

BetSide side_from_string(const std::string& s) {
    if (s == "UP" || s == "up" || s == "Up") return BetSide::UP;
    if (s == "DOWN" || s == "down" || s == "Down") return BetSide::DOWN;
    throw std::invalid_argument("Unknown bet side: " + s);
}

} // namespace pmkt
