#pragma once

/// @file metrics.hpp
/// @brief Post-run metrics computed from a scheduler trace.
///
/// Defines the aggregated statistics of a run (makespan, deadlines,
/// mutations, waiting times) and functions that derive them from in-memory
/// or on-disk traces.
///
/// @ingroup io_metrics

#include <tasksched/io/trace_writers.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tasksched::io {

/// @brief Aggregated metrics computed from a scheduler trace.
///
/// @ingroup io_metrics
/// @see compute_metrics, compute_metrics_from_file
struct RunMetrics {
    // -- Progress ------------------------------------------------------------

    uint64_t steps{0};             ///< Number of `step` records.
    int64_t makespan{0};           ///< Latest completion time (0 if nothing completed).
    uint64_t tasks_started{0};     ///< Number of task starts.
    uint64_t tasks_completed{0};   ///< Number of task completions.

    // -- Deadlines -----------------------------------------------------------

    uint64_t deadlines_met{0};
    uint64_t deadlines_missed{0};
    std::vector<std::string> missed_tasks;  ///< Ids that missed, in trace order.

    // -- Mutations -----------------------------------------------------------

    uint64_t initial_tasks{0};       ///< `task_added` records marked `initial`.
    uint64_t tasks_added{0};         ///< Includes the initial task set.
    uint64_t tasks_modified{0};
    uint64_t tasks_removed{0};
    uint64_t mutations_applied{0};   ///< Accepted add/modify/remove, initial load excluded.
    uint64_t mutations_rejected{0};
    uint64_t capacity_violations{0};

    // -- Capacity ------------------------------------------------------------

    /// @brief Mean fraction of capacity committed after each step, in [0, 1].
    double average_utilization{0.0};

    // -- Waiting times -------------------------------------------------------

    /// @brief Per-task delay between the last `task_added` and each start (task ID -> values).
    ///
    /// Tasks started without a preceding `task_added` record count from time 0.
    std::map<std::string, std::vector<int64_t>> waiting_times_per_task;
};

/// @brief Compute aggregated metrics from in-memory trace records.
///
/// @param traces  Trace records (typically from MemoryTraceWriter).
/// @return Populated RunMetrics.
///
/// @see compute_metrics_from_file, MemoryTraceWriter
RunMetrics compute_metrics(const std::vector<TraceRecord>& traces);

/// @brief Compute aggregated metrics from a JSON trace file on disk.
///
/// The file is the array written by JsonTraceWriter.
///
/// @param path  Filesystem path to a JSON trace file.
/// @return Populated RunMetrics.
///
/// @throws LoaderError  If the file cannot be read or parsed.
///
/// @see compute_metrics, JsonTraceWriter
RunMetrics compute_metrics_from_file(const std::filesystem::path& path);

/// @brief Parse the JSON array written by JsonTraceWriter back into records.
/// @throws LoaderError  If the text is not a JSON array.
std::vector<TraceRecord> parse_trace(std::string_view json);

} // namespace tasksched::io
