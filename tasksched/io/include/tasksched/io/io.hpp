#pragma once

/// @defgroup io I/O Library
/// @brief JSON scenarios, trace output, reports and metrics.
///
/// The I/O library handles all external data formats: loading scenario
/// JSON files into tasks and command scripts, writing scheduler traces
/// (JSON, textual, in-memory), writing end-of-run reports, and computing
/// post-run metrics from traces. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario JSON loader and writer.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers, and the run report.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Post-run metrics derived from traces.

// Convenience header for the I/O library

#include <tasksched/io/error.hpp>
#include <tasksched/io/trace_writers.hpp>
#include <tasksched/io/scenario_loader.hpp>
#include <tasksched/io/report.hpp>
#include <tasksched/io/metrics.hpp>
