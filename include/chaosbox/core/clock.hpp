/**
 * @file clock.hpp
 * @brief Injectable wall clock
 *
 * @date 2025
 */

#pragma once

#include <chrono>

namespace chaosbox {
namespace core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @class Clock
 * @brief Source of the current time for job timestamps and retention
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

/// Clock backed by std::chrono::system_clock
class SystemClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

} // namespace core
} // namespace chaosbox
