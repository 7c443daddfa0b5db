#pragma once

#include <tasksched/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace tasksched::core {

/// @brief Abstract interface for recording scheduler trace events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise scheduler events to a
/// specific format (JSON, text, memory buffer, etc.).
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record at a given scheduler time
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The SchedulerEngine holds an optional pointer to a TraceWriter. When no
/// writer is installed the overhead is a single null-pointer check.
///
/// @see SchedulerEngine::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given scheduler time.
    /// @param time The time at which the event occurs.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"task_start"`, `"mutation_rejected"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add a signed integer field (times, durations) to the current record.
    virtual void field(std::string_view key, int64_t value) = 0;

    /// @brief Add an unsigned integer field (counts, capacities) to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    ///
    /// After this call the writer is ready for a new begin()/end() cycle.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace tasksched::core
