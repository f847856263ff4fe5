#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace pmkt {

/**
 * Event emitted after an operation commits.
 */
struct MarketEvent {
    std::string event_type;     // "round_created", "round_resolved", "winnings_claimed"
    LedgerSeq ledger{0};
    LedgerTime timestamp{0};
    nlohmann::json data;
};

void to_json(nlohmann::json& j, const MarketEvent& e);

/**
 * Publication sink for market events. Transport is the host's concern.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const MarketEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

// Writes each event through spdlog at info level
class LoggingEventSink : public EventSink {
public:
    void publish(const MarketEvent& event) override;
};

/**
 * Appends events to a file in JSON lines format.
 */
class JsonLinesEventSink : public EventSink {
public:
    explicit JsonLinesEventSink(const std::string& path);
    ~JsonLinesEventSink() override;

    void publish(const MarketEvent& event) override;
    void flush();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
};

// Keeps events in memory (tests, replay summaries)
class RecordingEventSink : public EventSink {
public:
    void publish(const MarketEvent& event) override { events_.push_back(event); }

    const std::vector<MarketEvent>& events() const { return events_; }
    std::vector<MarketEvent> events_of_type(const std::string& type) const;
    void clear() { events_.clear(); }

private:
    std::vector<MarketEvent> events_;
};

// Fan-out to several sinks
class CompositeEventSink : public EventSink {
public:
    void add(EventSinkPtr sink) { sinks_.push_back(std::move(sink)); }
    void publish(const MarketEvent& event) override;

private:
    std::vector<EventSinkPtr> sinks_;
};

} // namespace pmkt
