#pragma once

// Minimal TraceWriter for algo tests: records event types and string fields.

#include <tasksched/core/trace_writer.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tasksched::algo::test_support {

struct Event {
    int64_t time{0};
    std::string type;
    std::map<std::string, std::string> fields;
};

class RecordingWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override {
        current_ = Event{};
        current_.time = core::time_to_units(time);
    }
    void type(std::string_view name) override { current_.type = std::string(name); }
    void field(std::string_view key, double value) override {
        current_.fields[std::string(key)] = std::to_string(value);
    }
    void field(std::string_view key, int64_t value) override {
        current_.fields[std::string(key)] = std::to_string(value);
    }
    void field(std::string_view key, uint64_t value) override {
        current_.fields[std::string(key)] = std::to_string(value);
    }
    void field(std::string_view key, std::string_view value) override {
        current_.fields[std::string(key)] = std::string(value);
    }
    void end() override { events.push_back(current_); }

    [[nodiscard]] std::vector<Event> of(std::string_view type) const {
        std::vector<Event> matching;
        for (const auto& event : events) {
            if (event.type == type) {
                matching.push_back(event);
            }
        }
        return matching;
    }

    std::vector<Event> events;

private:
    Event current_;
};

} // namespace tasksched::algo::test_support
