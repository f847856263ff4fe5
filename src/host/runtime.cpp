#include "host/runtime.hpp"
#include "persistence/sqlite_store.hpp"
#include <filesystem>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace pmkt {

void setup_logging(const LoggingConfig& config, const std::string& logger_name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        // stderr keeps stdout free for command results
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/" + logger_name + ".log",
            static_cast<size_t>(config.max_log_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_log_files)
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

std::shared_ptr<KeyValueStore> open_store(const StorageConfig& config) {
    if (config.backend == "memory") {
        spdlog::info("Using in-memory store");
        return std::make_shared<InMemoryStore>();
    }

    if (config.backend != "sqlite") {
        throw std::runtime_error("Unknown storage backend: " + config.backend);
    }

    std::filesystem::path p(config.sqlite_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    return std::make_shared<SqliteStore>(config.sqlite_path);
}

EventSinkPtr make_event_sink(const EventConfig& config) {
    auto composite = std::make_shared<CompositeEventSink>();
    bool any = false;

    if (config.log_events) {
        composite->add(std::make_shared<LoggingEventSink>());
        any = true;
    }
    if (!config.jsonl_path.empty()) {
        composite->add(std::make_shared<JsonLinesEventSink>(config.jsonl_path));
        any = true;
    }

    return any ? composite : nullptr;
}

} // namespace pmkt
