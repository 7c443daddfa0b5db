#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>

namespace tasksched::core {

/// @brief Unique task identifier (registry key).
/// @ingroup core_types
using TaskId = std::string;

/// @brief Time interval expressed as a whole number of scheduler time units.
///
/// Duration wraps an `int64_t` unit count. Construction is explicit so a
/// bare integer never silently becomes a time value. Arithmetic between two
/// Durations yields a Duration.
///
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t units_;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : units_(0) {}

    /// @brief Construct from a raw unit count.
    /// @param units Number of time units.
    explicit constexpr Duration(int64_t units) noexcept : units_(units) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Return the raw unit count.
    [[nodiscard]] constexpr int64_t count() const noexcept { return units_; }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{units_ + rhs.units_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{units_ - rhs.units_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        units_ += rhs.units_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        units_ -= rhs.units_;
        return *this;
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute scheduler time as a Duration offset from time zero.
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added.
///
/// @see Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

public:
    /// @brief Default constructor: time zero.
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Construct from an offset relative to time zero.
    /// @param d Offset from time zero.
    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    /// @brief Named factory returning time zero.
    static constexpr TimePoint epoch() noexcept { return TimePoint{}; }

    /// @brief Return the duration elapsed since time zero.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions
// ============================================================================

/// @brief Create a Duration from a raw unit count.
[[nodiscard]] constexpr Duration duration_from_units(int64_t units) noexcept {
    return Duration{units};
}

/// @brief Create a TimePoint at @p units time units after time zero.
[[nodiscard]] constexpr TimePoint time_from_units(int64_t units) noexcept {
    return TimePoint{Duration{units}};
}

/// @brief Convert a TimePoint to its unit count since time zero.
[[nodiscard]] constexpr int64_t time_to_units(TimePoint tp) noexcept {
    return tp.time_since_epoch().count();
}

/// @brief True if @p tp + @p d is representable, for a non-negative @p d.
///
/// TimePoint arithmetic does not check for overflow; callers that add
/// unbounded durations (task lengths taken from input) check first.
[[nodiscard]] constexpr bool can_advance(TimePoint tp, Duration d) noexcept {
    return d.count() <= std::numeric_limits<int64_t>::max() - time_to_units(tp);
}

} // namespace tasksched::core
