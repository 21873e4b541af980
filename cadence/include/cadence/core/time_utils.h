#pragma once

#include <chrono>
#include <string>

namespace cadence {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Fractional seconds, the unit delays and periods are expressed in
using Seconds = std::chrono::duration<double>;

/**
 * @brief Monotonic time point `delay` from now
 */
[[nodiscard]] inline TimePoint time_after(Seconds delay) {
    return Clock::now() + std::chrono::duration_cast<Clock::duration>(delay);
}

/**
 * @brief Seconds until `when` (negative once it has passed)
 */
[[nodiscard]] inline Seconds time_until(TimePoint when) {
    return std::chrono::duration_cast<Seconds>(when - Clock::now());
}

/**
 * @brief Uniform random value in [0, 1), thread-local generator
 */
[[nodiscard]] double random_unit();

/**
 * @brief Render a duration for humans, e.g. "250 milliseconds", "1 minute 5 seconds"
 */
[[nodiscard]] std::string pretty_time_delta(Seconds delta);

} // namespace cadence
