#include "host/command_runner.hpp"
#include "common/errors.hpp"
#include "utils/checked_math.hpp"
#include "utils/wide_int.hpp"
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pmkt {

void LedgerClock::advance(LedgerSeq ledgers, std::optional<LedgerTime> seconds) {
    sequence = checked_add(sequence, ledgers);
    timestamp += seconds.value_or(static_cast<LedgerTime>(ledgers) * seconds_per_ledger);
}

// ============================================================================
// Field readers
// ============================================================================

namespace {

const nlohmann::json& require_field(const nlohmann::json& command, const char* name) {
    if (!command.contains(name)) {
        throw std::invalid_argument(std::string("Missing field '") + name + "'");
    }
    return command.at(name);
}

template <typename T>
T unsigned_field(const nlohmann::json& command, const char* name) {
    const auto& value = require_field(command, name);
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
        throw std::invalid_argument(std::string("Field '") + name + "' must be a non-negative integer");
    }
    uint64_t raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string("Field '") + name + "' is out of range");
    }
    return static_cast<T>(raw);
}

template <typename T>
std::optional<T> optional_unsigned(const nlohmann::json& command, const char* name) {
    if (!command.contains(name) || command.at(name).is_null()) {
        return std::nullopt;
    }
    return unsigned_field<T>(command, name);
}

nlohmann::json optional_json(const auto& value) {
    if (!value) return nullptr;
    return nlohmann::json(*value);
}

} // anonymous namespace

std::string string_field(const nlohmann::json& command, const char* name) {
    const auto& value = require_field(command, name);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("Field '") + name + "' must be a string");
    }
    return value.get<std::string>();
}

Amount amount_field(const nlohmann::json& command, const char* name) {
    const auto& value = require_field(command, name);
    if (value.is_string()) {
        return parse_amount(value.get<std::string>());
    }
    if (value.is_number_unsigned()) {
        return static_cast<Amount>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return static_cast<Amount>(value.get<int64_t>());
    }
    throw std::invalid_argument(std::string("Field '") + name + "' must be an integer or decimal string");
}

Price price_field(const nlohmann::json& command, const char* name) {
    const auto& value = require_field(command, name);
    if (value.is_string()) {
        return parse_price(value.get<std::string>());
    }
    if (value.is_number_unsigned() || (value.is_number_integer() && value.get<int64_t>() >= 0)) {
        return static_cast<Price>(value.get<uint64_t>());
    }
    throw std::invalid_argument(std::string("Field '") + name + "' must be a non-negative integer or decimal string");
}

// ============================================================================
// Dispatch
// ============================================================================

const std::vector<std::string>& CommandRunner::operations() {
    static const std::vector<std::string> ops = {
        "initialize", "set_windows", "create_round",
        "place_bet", "place_precision_prediction", "predict_price",
        "resolve_round", "claim_winnings", "mint_initial",
        "get_admin", "get_oracle", "get_active_round", "get_user_stats",
        "get_pending_winnings", "get_user_position", "get_user_precision_prediction",
        "get_precision_predictions", "get_updown_positions", "balance",
        "get_last_round_id", "get_windows", "get_round_phase",
        "advance"
    };
    return ops;
}

CallContext CommandRunner::context_for(const nlohmann::json& command,
                                       const std::string& default_signer) const {
    CallContext ctx;
    ctx.sequence = optional_unsigned<LedgerSeq>(command, "ledger").value_or(clock_.sequence);
    ctx.timestamp = optional_unsigned<LedgerTime>(command, "timestamp").value_or(clock_.timestamp);

    if (command.contains("caller")) {
        const auto& caller = command.at("caller");
        if (caller.is_string()) {
            ctx.signers.insert(caller.get<std::string>());
        } else if (caller.is_array()) {
            for (const auto& c : caller) {
                if (!c.is_string()) {
                    throw std::invalid_argument("Field 'caller' must hold strings");
                }
                ctx.signers.insert(c.get<std::string>());
            }
        } else if (!caller.is_null()) {
            throw std::invalid_argument("Field 'caller' must be a string or an array");
        }
    } else if (!default_signer.empty()) {
        ctx.signers.insert(default_signer);
    }

    return ctx;
}

nlohmann::json CommandRunner::execute(const nlohmann::json& command) {
    if (!command.is_object()) {
        throw std::invalid_argument("Command must be a JSON object");
    }
    std::string op = string_field(command, "op");
    spdlog::debug("Executing {} at ledger {}", op, clock_.sequence);

    // Clock
    if (op == "advance") {
        LedgerSeq ledgers = optional_unsigned<LedgerSeq>(command, "ledgers").value_or(1);
        clock_.advance(ledgers, optional_unsigned<LedgerTime>(command, "seconds"));
        return nlohmann::json{{"ledger", clock_.sequence}, {"timestamp", clock_.timestamp}};
    }

    // Administration
    if (op == "initialize") {
        std::string admin = string_field(command, "admin");
        std::string oracle = string_field(command, "oracle");
        market_.initialize(admin, oracle, context_for(command, admin));
        return nlohmann::json{{"admin", admin}, {"oracle", oracle}};
    }
    if (op == "set_windows") {
        LedgerSeq bet = unsigned_field<LedgerSeq>(command, "bet_ledgers");
        LedgerSeq run = unsigned_field<LedgerSeq>(command, "run_ledgers");
        market_.set_windows(bet, run, context_for(command, ""));
        return nlohmann::json{{"bet_ledgers", bet}, {"run_ledgers", run}};
    }
    if (op == "create_round") {
        Price start_price = price_field(command, "start_price");
        auto mode = optional_unsigned<uint32_t>(command, "mode");
        return market_.create_round(start_price, mode, context_for(command, ""));
    }

    // Users
    if (op == "place_bet") {
        std::string user = string_field(command, "user");
        Amount amount = amount_field(command, "amount");
        BetSide side = side_from_string(string_field(command, "side"));
        market_.place_bet(user, amount, side, context_for(command, user));
        return optional_json(market_.get_user_position(user));
    }
    if (op == "place_precision_prediction" || op == "predict_price") {
        std::string user = string_field(command, "user");
        Amount amount = amount_field(command, "amount");
        const char* price_key = op == "predict_price" ? "guessed_price" : "predicted_price";
        uint32_t price = unsigned_field<uint32_t>(command, price_key);
        if (op == "predict_price") {
            market_.predict_price(user, price, amount, context_for(command, user));
        } else {
            market_.place_precision_prediction(user, amount, price, context_for(command, user));
        }
        return optional_json(market_.get_user_precision_prediction(user));
    }
    if (op == "claim_winnings") {
        std::string user = string_field(command, "user");
        Amount claimed = market_.claim_winnings(user, context_for(command, user));
        return nlohmann::json{{"user", user}, {"claimed", amount_to_string(claimed)}};
    }
    if (op == "mint_initial") {
        std::string user = string_field(command, "user");
        Amount balance = market_.mint_initial(user, context_for(command, user));
        return nlohmann::json{{"user", user}, {"balance", amount_to_string(balance)}};
    }

    // Oracle
    if (op == "resolve_round") {
        OraclePayload payload;
        payload.price = price_field(command, "price");
        payload.timestamp = unsigned_field<LedgerTime>(command, "observed_at");
        payload.round_id = unsigned_field<LedgerSeq>(command, "round_id");
        return market_.resolve_round(payload, context_for(command, ""));
    }

    // Reads
    if (op == "get_admin") {
        return optional_json(market_.get_admin());
    }
    if (op == "get_oracle") {
        return optional_json(market_.get_oracle());
    }
    if (op == "get_active_round") {
        return optional_json(market_.get_active_round());
    }
    if (op == "get_user_stats") {
        return market_.get_user_stats(string_field(command, "user"));
    }
    if (op == "get_pending_winnings") {
        std::string user = string_field(command, "user");
        return nlohmann::json{{"user", user},
                              {"pending", amount_to_string(market_.get_pending_winnings(user))}};
    }
    if (op == "get_user_position") {
        return optional_json(market_.get_user_position(string_field(command, "user")));
    }
    if (op == "get_user_precision_prediction") {
        return optional_json(market_.get_user_precision_prediction(string_field(command, "user")));
    }
    if (op == "get_precision_predictions") {
        return market_.get_precision_predictions();
    }
    if (op == "get_updown_positions") {
        nlohmann::json positions = nlohmann::json::object();
        for (const auto& [user, position] : market_.get_updown_positions()) {
            positions[user] = position;
        }
        return positions;
    }
    if (op == "balance") {
        std::string user = string_field(command, "user");
        return nlohmann::json{{"user", user}, {"balance", amount_to_string(market_.balance(user))}};
    }
    if (op == "get_last_round_id") {
        return nlohmann::json{{"last_round_id", market_.get_last_round_id()}};
    }
    if (op == "get_windows") {
        WindowConfig w = market_.get_windows();
        return nlohmann::json{{"bet_ledgers", w.bet_ledgers}, {"run_ledgers", w.run_ledgers}};
    }
    if (op == "get_round_phase") {
        LedgerSeq at = optional_unsigned<LedgerSeq>(command, "ledger").value_or(clock_.sequence);
        return nlohmann::json{{"ledger", at},
                              {"phase", phase_to_string(market_.get_round_phase(at))}};
    }

    throw std::invalid_argument("Unknown operation: " + op);
}

} // namespace pmkt
