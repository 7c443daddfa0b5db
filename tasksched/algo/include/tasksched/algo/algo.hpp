#pragma once

/// @defgroup algo Algo Library
/// @brief Readiness, capacity packing, the step engine, deadlines and drivers.
///
/// The algo library implements the scheduling policy on top of the core
/// data model: the readiness resolver, the knapsack capacity packer, the
/// step-driven SchedulerEngine, deadline classification, dependency
/// diagnostics, mutation commands and the batch driver. Depends on core only.

/// @defgroup algo_schedulers Schedulers
/// @ingroup algo
/// @brief Readiness, packing and the step engine.

/// @defgroup algo_commands Commands
/// @ingroup algo
/// @brief Registry mutations and the sources that supply them.

/// @defgroup algo_deadlines Deadlines
/// @ingroup algo
/// @brief Post-hoc deadline classification.

/// @defgroup algo_diagnostics Diagnostics
/// @ingroup algo
/// @brief Queries for tasks that can never start.

/// @defgroup algo_driver Driver
/// @ingroup algo
/// @brief Batch driver loop.

// Convenience header for the algo library

#include <tasksched/algo/readiness_resolver.hpp>
#include <tasksched/algo/capacity_packer.hpp>
#include <tasksched/algo/command.hpp>
#include <tasksched/algo/scheduler_engine.hpp>
#include <tasksched/algo/deadline_tracker.hpp>
#include <tasksched/algo/diagnostics.hpp>
#include <tasksched/algo/command_source.hpp>
#include <tasksched/algo/driver.hpp>
