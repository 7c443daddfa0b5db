#pragma once

/// @defgroup core Core Library
/// @brief Time types, tasks, the task registry, the event timeline and tracing.
///
/// The core library provides the data model shared by the scheduling
/// algorithms and the I/O layer. It has no dependencies on scheduling
/// policy or file formats.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for time and task identifiers.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Completion events and the timeline that orders them.

// Convenience header for the core library
#include <tasksched/core/types.hpp>
#include <tasksched/core/error.hpp>
#include <tasksched/core/task.hpp>
#include <tasksched/core/task_registry.hpp>
#include <tasksched/core/event_timeline.hpp>
#include <tasksched/core/schedule_log.hpp>
#include <tasksched/core/trace_writer.hpp>
