#pragma once

#include <memory>
#include "config/config.hpp"
#include "events/event_sink.hpp"
#include "storage/key_value_store.hpp"

namespace pmkt {

// Host wiring shared by the pmkt CLI and the replay tool

// Build the default spdlog logger from the logging section
void setup_logging(const LoggingConfig& config, const std::string& logger_name = "pmkt");

// Open the configured store (sqlite file or in-memory map)
std::shared_ptr<KeyValueStore> open_store(const StorageConfig& config);

// Event sinks selected by the events section; nullptr when none is enabled
EventSinkPtr make_event_sink(const EventConfig& config);

} // namespace pmkt
