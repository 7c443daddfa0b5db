#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for scheduler output.
///
/// Provides several writers that implement the @ref core::TraceWriter
/// interface: a no-op writer, a JSON streaming writer, an in-memory buffer
/// for post-processing, and a human-readable textual writer with optional
/// ANSI colour output.
///
/// @ingroup io_writers

#include <tasksched/core/trace_writer.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tasksched::io {

/// @brief Trace writer that silently discards all events.
///
/// @ingroup io_writers
/// @see core::TraceWriter
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams JSON array elements to an output stream.
///
/// Writes one JSON object per trace event directly to the provided stream
/// (file or stdout). Call @ref finalize to emit the closing bracket once
/// the run is complete.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, uint64_t value) override;

    /// @brief Add a string field; the value is JSON-escaped.
    void field(std::string_view key, std::string_view value) override;

    void end() override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// Must be called exactly once after all events have been written.
    /// The destructor calls this automatically if it has not been invoked.
    void finalize();

private:
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief Value of a single trace field.
using TraceValue = std::variant<double, int64_t, uint64_t, std::string>;

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, compute_metrics
struct TraceRecord {
    int64_t time{0};    ///< Scheduler time of the event (time units).
    std::string type;   ///< Event type identifier (e.g. "task_start").
    std::unordered_map<std::string, TraceValue> fields;  ///< Named fields.
};

/// @brief Trace writer that buffers all events in memory as @ref TraceRecord objects.
///
/// Ideal for unit tests and post-run analysis where the full trace must be
/// inspected programmatically.
///
/// @ingroup io_writers
/// @see TraceRecord, compute_metrics, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated trace records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of the given type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer with optional ANSI colour.
///
/// Formats each event as a single line with aligned columns. Colour can
/// be disabled for piping to files or non-terminal sinks.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter, NullTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for colour.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Flush the buffered fields and write the formatted line.
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] std::string_view color_of(std::string_view type) const;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    int64_t current_time_{0};
    std::optional<int64_t> prev_time_;
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

/// @brief Trace writer that forwards every event to two other writers.
///
/// Both writers must outlive the tee.
///
/// @ingroup io_writers
class TeeTraceWriter : public core::TraceWriter {
public:
    TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second)
        : first_(first)
        , second_(second) {}

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    core::TraceWriter& first_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TraceWriter& second_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

/// @brief Read a field as a signed integer, or @p default_val if absent.
[[nodiscard]] int64_t get_int_field(const TraceRecord& record, const std::string& key,
                                    int64_t default_val = 0);

/// @brief Read a field as a string, or @p default_val if absent.
[[nodiscard]] std::string get_string_field(const TraceRecord& record, const std::string& key,
                                           const std::string& default_val = {});

} // namespace tasksched::io
