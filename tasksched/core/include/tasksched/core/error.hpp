#pragma once

#include <stdexcept>
#include <string>

namespace tasksched::core {

/// @brief Base exception for all scheduler errors.
///
/// All exceptions thrown by the core and algo libraries derive from this
/// class, allowing callers to catch scheduler-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidTaskError, InvalidMutationError, InvalidStateError
/// @ingroup core
class SchedulerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a task definition carries an invalid attribute.
///
/// Durations, worker requirements and priorities must be strictly
/// positive, and the identifier must not be empty.
///
/// @see Task::validate
/// @ingroup core
class InvalidTaskError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

/// @brief Thrown when a registry mutation cannot be applied.
///
/// A rejected mutation never changes scheduler state. Drivers that feed
/// commands through SchedulerEngine::apply() never see this exception;
/// it is converted into a rejected MutationOutcome instead.
///
/// @see UnknownTaskError, TaskInProgressError
/// @ingroup core
class InvalidMutationError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

/// @brief Thrown when modify or remove references an id absent from the registry.
/// @ingroup core
class UnknownTaskError : public InvalidMutationError {
public:
    /// @brief Construct the error for the given task id.
    /// @param id Identifier that was not found.
    explicit UnknownTaskError(const std::string& id)
        : InvalidMutationError("unknown task '" + id + "'")
        , id_(id) {}

    /// @brief Identifier that was not found.
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

/// @brief Thrown when removing a task whose execution has already been committed.
///
/// In-progress tasks hold reserved capacity and a pending completion
/// event; they always run to completion.
///
/// @ingroup core
class TaskInProgressError : public InvalidMutationError {
public:
    /// @brief Construct the error for the given task id.
    /// @param id Identifier of the in-progress task.
    explicit TaskInProgressError(const std::string& id)
        : InvalidMutationError("task '" + id + "' is in progress")
        , id_(id) {}

    /// @brief Identifier of the in-progress task.
    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, pushing a second live completion event for the same task
/// onto the EventTimeline.
///
/// @ingroup core
class InvalidStateError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

} // namespace tasksched::core
