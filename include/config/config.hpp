#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace pmkt {

struct StorageConfig {
    std::string backend{"sqlite"};               // sqlite, memory
    std::string sqlite_path{"./data/pmkt.db"};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct EventConfig {
    bool log_events{true};                   // Echo events through spdlog
    std::string jsonl_path;                  // Empty disables the event file
};

struct Config {
    StorageConfig storage;
    LoggingConfig logging;
    EventConfig events;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const EventConfig& c);
void from_json(const nlohmann::json& j, EventConfig& c);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace pmkt
