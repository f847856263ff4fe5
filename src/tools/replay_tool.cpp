#include <iostream>
#include <fstream>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/errors.hpp"
#include "config/config.hpp"
#include "events/event_sink.hpp"
#include "host/command_runner.hpp"
#include "host/runtime.hpp"
#include "market/prediction_market.hpp"

using namespace pmkt;

/**
 * Replay tool: run a scripted session of market operations.
 *
 * Usage:
 *   ./pmkt_replay --input scripts/updown_round.jsonl
 *
 * Each input line is one CommandRunner command. `{"op": "advance",
 * "ledgers": 6}` moves the simulated ledger clock. A command carrying
 * "expect_error": "<ErrorName>" must fail with that error; any other
 * failure or a missing expected failure counts as a mismatch.
 */

struct ReplayStats {
    int commands_executed{0};
    int commands_rejected{0};
    int expected_errors{0};
    int mismatches{0};
    int rounds_resolved{0};
};

namespace {

void print_summary(const ReplayStats& stats, const RecordingEventSink& events,
                   const LedgerClock& clock) {
    std::cout << "\n========================================\n";
    std::cout << "REPLAY SUMMARY\n";
    std::cout << "========================================\n";
    std::cout << "Commands executed:  " << stats.commands_executed << "\n";
    std::cout << "Commands rejected:  " << stats.commands_rejected << "\n";
    std::cout << "Expected errors:    " << stats.expected_errors << "\n";
    std::cout << "Mismatches:         " << stats.mismatches << "\n";
    std::cout << "Rounds resolved:    " << stats.rounds_resolved << "\n";
    std::cout << "Events published:   " << events.events().size() << "\n";
    std::cout << "Final ledger:       " << clock.sequence << " (t=" << clock.timestamp << ")\n";
    std::cout << "========================================\n";
}

} // anonymous namespace

bool run_replay(const std::string& input_file, const Config& config, bool verbose) {
    spdlog::info("Starting replay from: {}", input_file);

    std::ifstream file(input_file);
    if (!file.is_open()) {
        spdlog::error("Failed to open input file: {}", input_file);
        return false;
    }

    auto recorder = std::make_shared<RecordingEventSink>();
    auto sinks = std::make_shared<CompositeEventSink>();
    sinks->add(recorder);
    if (auto configured = make_event_sink(config.events)) {
        sinks->add(configured);
    }

    PredictionMarket market(open_store(config.storage), sinks);
    CommandRunner runner(market);
    ReplayStats stats;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty() || line[0] == '#') continue;

        nlohmann::json command;
        try {
            command = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::error("Line {}: malformed JSON: {}", line_no, e.what());
            stats.mismatches++;
            continue;
        }
        if (!command.is_object()) {
            spdlog::error("Line {}: command must be a JSON object", line_no);
            stats.mismatches++;
            continue;
        }

        std::string expected = command.value("expect_error", "");
        std::string op = command.value("op", "");

        try {
            nlohmann::json result = runner.execute(command);
            stats.commands_executed++;
            if (op == "resolve_round") stats.rounds_resolved++;

            if (!expected.empty()) {
                spdlog::error("Line {}: {} succeeded, expected {}", line_no, op, expected);
                stats.mismatches++;
            } else if (verbose) {
                std::cout << "[" << line_no << "] " << op << " -> " << result.dump() << "\n";
            }
        } catch (const MarketError& e) {
            stats.commands_rejected++;
            std::string actual = error_to_string(e.code());
            if (actual == expected) {
                stats.expected_errors++;
                if (verbose) {
                    std::cout << "[" << line_no << "] " << op << " -> " << actual << " (expected)\n";
                }
            } else {
                spdlog::error("Line {}: {} failed with {}, expected {}", line_no, op, actual,
                              expected.empty() ? "success" : expected);
                stats.mismatches++;
            }
        } catch (const std::invalid_argument& e) {
            spdlog::error("Line {}: invalid command: {}", line_no, e.what());
            stats.mismatches++;
        } catch (const std::out_of_range& e) {
            spdlog::error("Line {}: value out of range: {}", line_no, e.what());
            stats.mismatches++;
        }
    }

    print_summary(stats, *recorder, runner.clock());
    return stats.mismatches == 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"pmkt Replay Tool - Run scripted market sessions"};

    std::string input_file;
    std::string config_path = "configs/pmkt.json";
    std::string db_path;
    bool verbose = false;

    app.add_option("-i,--input", input_file, "JSON-lines script of market commands")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--db", db_path, "Replay against this SQLite database instead of memory");
    app.add_flag("-v,--verbose", verbose, "Print every command result");

    CLI11_PARSE(app, argc, argv);

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

    // Replays start from a clean in-memory state unless a database is named
    if (db_path.empty()) {
        config.storage.backend = "memory";
    } else {
        config.storage.backend = "sqlite";
        config.storage.sqlite_path = db_path;
    }

    setup_logging(config.logging, "pmkt_replay");

    bool ok = false;
    try {
        ok = run_replay(input_file, config, verbose);
    } catch (const std::exception& e) {
        spdlog::error("Replay aborted: {}", e.what());
        return 2;
    }

    return ok ? 0 : 1;
}
