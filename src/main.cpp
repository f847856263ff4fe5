#include <algorithm>
#include <iostream>
#include <filesystem>
#include <map>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "config/config.hpp"
#include "host/command_runner.hpp"
#include "host/runtime.hpp"
#include "market/prediction_market.hpp"

using namespace pmkt;

/**
 * pmkt - operate a prediction market stored in a local database.
 *
 * Usage:
 *   ./pmkt --caller admin initialize --admin admin --oracle oracle
 *   ./pmkt --ledger 100 create-round --start-price 50000 --mode 0
 *   ./pmkt --ledger 101 place-bet --user alice --amount 1000 --side up
 *   ./pmkt --ledger 112 --timestamp 1000 resolve-round --price 51000 \
 *          --observed-at 990 --round-id 100
 *
 * Each invocation runs one operation at the ledger given by --ledger and
 * --timestamp and prints its result as JSON on stdout.
 */

namespace {

enum class FieldKind {
    TEXT,       // JSON string
    WIDE,       // 128-bit integer, passed as decimal string
    UINT        // JSON unsigned integer
};

struct FieldDef {
    std::string name;          // command field, also the option name with '-' for '_'
    FieldKind kind;
    bool required;
    std::string help;
};

struct OperationDef {
    std::string op;
    std::string help;
    std::vector<FieldDef> fields;
};

const std::vector<OperationDef>& operation_defs() {
    static const std::vector<OperationDef> defs = {
        {"initialize", "Set the admin and oracle (once)", {
            {"admin", FieldKind::TEXT, true, "Administrator address"},
            {"oracle", FieldKind::TEXT, true, "Oracle address"}}},
        {"set_windows", "Set betting and run window lengths in ledgers", {
            {"bet_ledgers", FieldKind::UINT, true, "Ledgers during which staking is open"},
            {"run_ledgers", FieldKind::UINT, true, "Ledgers until the round can resolve"}}},
        {"create_round", "Open a new round", {
            {"start_price", FieldKind::WIDE, true, "Reference price"},
            {"mode", FieldKind::UINT, false, "0 = Up/Down (default), 1 = Precision"}}},
        {"place_bet", "Stake on a direction in an Up/Down round", {
            {"user", FieldKind::TEXT, true, "User address"},
            {"amount", FieldKind::WIDE, true, "Stake amount"},
            {"side", FieldKind::TEXT, true, "up or down"}}},
        {"place_precision_prediction", "Stake on an exact price in a Precision round", {
            {"user", FieldKind::TEXT, true, "User address"},
            {"amount", FieldKind::WIDE, true, "Stake amount"},
            {"predicted_price", FieldKind::UINT, true, "Price scaled x10000"}}},
        {"predict_price", "Alias of place-precision-prediction", {
            {"user", FieldKind::TEXT, true, "User address"},
            {"guessed_price", FieldKind::UINT, true, "Price scaled x10000"},
            {"amount", FieldKind::WIDE, true, "Stake amount"}}},
        {"resolve_round", "Resolve the active round with an oracle observation", {
            {"price", FieldKind::WIDE, true, "Observed price"},
            {"observed_at", FieldKind::UINT, true, "Observation timestamp (seconds)"},
            {"round_id", FieldKind::UINT, true, "Start ledger of the round"}}},
        {"claim_winnings", "Move pending winnings into the balance", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"mint_initial", "Credit the starting balance once", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_admin", "Show the admin", {}},
        {"get_oracle", "Show the oracle", {}},
        {"get_active_round", "Show the active round", {}},
        {"get_user_stats", "Show a user's win/loss stats", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_pending_winnings", "Show a user's pending winnings", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_user_position", "Show a user's Up/Down position", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_user_precision_prediction", "Show a user's Precision prediction", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_precision_predictions", "List Precision predictions", {}},
        {"get_updown_positions", "List Up/Down positions", {}},
        {"balance", "Show a user's balance", {
            {"user", FieldKind::TEXT, true, "User address"}}},
        {"get_last_round_id", "Show the last issued round number", {}},
        {"get_windows", "Show the window configuration", {}},
        {"get_round_phase", "Show the round phase at --ledger", {}},
    };
    return defs;
}

std::string dashed(std::string name) {
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

// Option storage for one subcommand
struct ParsedFields {
    std::map<std::string, std::string> text;
    std::map<std::string, uint64_t> uints;
};

nlohmann::json build_command(const OperationDef& def, const ParsedFields& parsed) {
    nlohmann::json command{{"op", def.op}};
    for (const auto& field : def.fields) {
        if (field.kind == FieldKind::UINT) {
            auto it = parsed.uints.find(field.name);
            if (it != parsed.uints.end()) command[field.name] = it->second;
        } else {
            auto it = parsed.text.find(field.name);
            if (it != parsed.text.end()) command[field.name] = it->second;
        }
    }
    return command;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLI::App app{"pmkt - Prediction market settlement engine"};
    app.require_subcommand(0, 1);

    std::string config_path = Config::get_env("PMKT_CONFIG", "configs/pmkt.json");
    std::string db_path;
    std::vector<std::string> callers;
    LedgerSeq ledger = 1;
    LedgerTime timestamp = 0;
    std::string log_level;
    bool show_version = false;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--db", db_path, "SQLite database (overrides storage.sqlite_path)");
    app.add_option("--caller", callers, "Principal authorizing the call (repeatable)");
    app.add_option("--ledger", ledger, "Ledger sequence of the call");
    app.add_option("--timestamp", timestamp, "Ledger close time of the call (seconds)");
    app.add_option("--log-level", log_level, "debug, info, warn, error");
    app.add_flag("-v,--version", show_version, "Show version information");

    // One subcommand per operation; fields are stored per subcommand
    std::map<std::string, ParsedFields> parsed;
    for (const auto& def : operation_defs()) {
        CLI::App* sub = app.add_subcommand(dashed(def.op), def.help);
        ParsedFields& fields = parsed[def.op];
        for (const auto& field : def.fields) {
            std::string flag = "--" + dashed(field.name);
            CLI::Option* opt = nullptr;
            if (field.kind == FieldKind::UINT) {
                opt = sub->add_option_function<uint64_t>(
                    flag, [&fields, name = field.name](const uint64_t& v) { fields.uints[name] = v; },
                    field.help);
            } else {
                opt = sub->add_option_function<std::string>(
                    flag, [&fields, name = field.name](const std::string& v) { fields.text[name] = v; },
                    field.help);
            }
            if (field.required) opt->required();
        }
    }

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "pmkt v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 2;
    }
    if (!db_path.empty()) {
        config.storage.backend = "sqlite";
        config.storage.sqlite_path = db_path;
    }
    if (!log_level.empty()) {
        config.logging.log_level = log_level;
    }

    setup_logging(config.logging);

    const OperationDef* selected = nullptr;
    for (const auto& def : operation_defs()) {
        if (app.got_subcommand(dashed(def.op))) {
            selected = &def;
            break;
        }
    }
    if (!selected) {
        std::cerr << app.help();
        return 2;
    }

    nlohmann::json command = build_command(*selected, parsed[selected->op]);
    if (!callers.empty()) {
        command["caller"] = callers;
    }

    try {
        PredictionMarket market(open_store(config.storage), make_event_sink(config.events));

        LedgerClock clock;
        clock.sequence = ledger;
        clock.timestamp = timestamp;
        CommandRunner runner(market, clock);

        nlohmann::json result = runner.execute(command);
        std::cout << result.dump(2) << "\n";
    } catch (const MarketError& e) {
        nlohmann::json error{
            {"error", error_to_string(e.code())},
            {"code", e.numeric_code()},
            {"message", e.what()}
        };
        std::cout << error.dump(2) << "\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", selected->op, e.what());
        return 2;
    }

    spdlog::shutdown();
    return 0;
}
