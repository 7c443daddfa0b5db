#pragma once

/// @file report.hpp
/// @brief JSON summary of an engine's state after a run.
/// @ingroup io_writers

#include <tasksched/algo/driver.hpp>
#include <tasksched/algo/scheduler_engine.hpp>

#include <filesystem>
#include <ostream>

namespace tasksched::io {

/// @brief Write a JSON report of @p engine to @p out.
///
/// The report holds the engine settings, the final time, the schedule log
/// (one entry per step), the completion time and deadline status of every
/// completed task, and the diagnostics for tasks that can never start
/// (missing dependencies, oversized tasks, dependency cycles).
///
/// If @p summary is given, its status and mutation counts are included.
///
/// @ingroup io_writers
/// @see algo::DeadlineTracker, algo::blocked_on_missing_dependencies
void write_report(const algo::SchedulerEngine& engine, std::ostream& out,
                  const algo::RunSummary* summary = nullptr);

/// @brief Write the report to a file.
/// @throws LoaderError  If the file cannot be opened for writing.
void write_report(const algo::SchedulerEngine& engine, const std::filesystem::path& path,
                  const algo::RunSummary* summary = nullptr);

} // namespace tasksched::io
