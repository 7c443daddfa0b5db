#pragma once

#include <tasksched/core/types.hpp>

#include <cstddef>
#include <utility>
#include <vector>

namespace tasksched::core {

/// @brief What happened during one scheduler step.
/// @ingroup core
struct ScheduleRecord {
    TimePoint time;                  ///< Time at which the step ran.
    std::vector<TaskId> started;     ///< Tasks committed this step.
    std::vector<TaskId> completed;   ///< Tasks drained from the timeline this step.

    bool operator==(const ScheduleRecord&) const = default;
};

/// @brief Append-only sequence of ScheduleRecord, one per executed step.
///
/// Used for replay, audit and deadline evaluation. Records are never
/// modified once appended.
///
/// @see DeadlineTracker
/// @ingroup core
class ScheduleLog {
public:
    using const_iterator = std::vector<ScheduleRecord>::const_iterator;

    void append(ScheduleRecord record) { records_.push_back(std::move(record)); }

    [[nodiscard]] const std::vector<ScheduleRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] bool empty() const noexcept { return records_.empty(); }

    /// @brief Most recent record. The log must not be empty.
    [[nodiscard]] const ScheduleRecord& back() const { return records_.back(); }

    [[nodiscard]] const_iterator begin() const noexcept { return records_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return records_.end(); }

private:
    std::vector<ScheduleRecord> records_;
};

} // namespace tasksched::core
