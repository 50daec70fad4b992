/**
 * @file flush_schedule.hpp
 * @brief Flush tick arithmetic for the daemon loop.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <algorithm>
#include <chrono>

namespace remote_shipper {

using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Deadline of the flush after the one scheduled at @p scheduled.
 *
 * Never earlier than @p now: ticks missed during a slow delivery are
 * dropped rather than shipped back to back.
 */
[[nodiscard]] inline SteadyTime next_flush_after(SteadyTime scheduled,
                                                 std::chrono::milliseconds interval,
                                                 SteadyTime now) {
    return std::max(scheduled + interval, now);
}

}  // namespace remote_shipper
