#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pmkt {

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = nlohmann::json{
        {"backend", c.backend},
        {"sqlite_path", c.sqlite_path}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("sqlite_path")) j.at("sqlite_path").get_to(c.sqlite_path);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const EventConfig& c) {
    j = nlohmann::json{
        {"log_events", c.log_events},
        {"jsonl_path", c.jsonl_path}
    };
}

void from_json(const nlohmann::json& j, EventConfig& c) {
    if (j.contains("log_events")) j.at("log_events").get_to(c.log_events);
    if (j.contains("jsonl_path")) j.at("jsonl_path").get_to(c.jsonl_path);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"storage", c.storage},
        {"logging", c.logging},
        {"events", c.events}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("storage")) j.at("storage").get_to(c.storage);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("events")) j.at("events").get_to(c.events);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (storage.backend != "sqlite" && storage.backend != "memory") {
        spdlog::error("storage.backend must be 'sqlite' or 'memory', got '{}'", storage.backend);
        return false;
    }

    if (storage.backend == "sqlite" && storage.sqlite_path.empty()) {
        spdlog::error("storage.sqlite_path is required for the sqlite backend");
        return false;
    }

    if (storage.backend == "memory") {
        spdlog::warn("memory backend selected, state is lost when the process exits");
    }

    if (logging.log_level != "debug" && logging.log_level != "info" &&
        logging.log_level != "warn" && logging.log_level != "error") {
        spdlog::error("logging.log_level must be one of debug, info, warn, error");
        return false;
    }

    if (logging.log_to_file && (logging.max_log_file_size_mb <= 0 || logging.max_log_files <= 0)) {
        spdlog::error("log rotation limits must be positive");
        return false;
    }

    return true;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace pmkt
