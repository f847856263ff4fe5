#include "events/event_sink.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <stdexcept>

namespace pmkt {

void to_json(nlohmann::json& j, const MarketEvent& e) {
    j = nlohmann::json{
        {"event_type", e.event_type},
        {"ledger", e.ledger},
        {"timestamp", e.timestamp},
        {"data", e.data}
    };
}

void LoggingEventSink::publish(const MarketEvent& event) {
    spdlog::info("[event] {} ledger={} {}", event.event_type, event.ledger, event.data.dump());
}

JsonLinesEventSink::JsonLinesEventSink(const std::string& path)
    : path_(path)
{
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open event log: " + path_);
    }
    spdlog::info("Event log opened: {}", path_);
}

JsonLinesEventSink::~JsonLinesEventSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void JsonLinesEventSink::publish(const MarketEvent& event) {
    nlohmann::json j = event;
    file_ << j.dump() << "\n";
    if (!file_) {
        spdlog::error("Failed to write event {} to {}", event.event_type, path_);
    }
}

void JsonLinesEventSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

std::vector<MarketEvent> RecordingEventSink::events_of_type(const std::string& type) const {
    std::vector<MarketEvent> result;
    for (const auto& e : events_) {
        if (e.event_type == type) {
            result.push_back(e);
        }
    }
    return result;
}

void CompositeEventSink::publish(const MarketEvent& event) {
    for (const auto& sink : sinks_) {
        sink->publish(event);
    }
}

} // namespace pmkt
