/* SPDX-License-Identifier: MIT */
/*
 * Tunlink Time Utilities
 * Monotonic-ish millisecond clock and interval helpers
 */

#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <thread>

namespace tunlink {

    using namespace dp;

    // =============================================================================
    // Time Utilities
    // =============================================================================

    namespace time {

        // Get current timestamp in nanoseconds
        inline auto now_ns() -> i64 { return dp::Stamp<u8>::now(); }

        // Get current timestamp in milliseconds
        inline auto now_ms() -> u64 { return static_cast<u64>(now_ns() / 1'000'000); }

        inline auto secs_to_ms(u64 secs) -> u64 { return secs * 1000; }

        // Sleep for specified milliseconds
        inline auto sleep_ms(u64 ms) -> void { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

        // Milliseconds elapsed since `since`, zero if the clock went backwards
        [[nodiscard]] inline auto elapsed_ms(u64 since, u64 now) -> u64 { return now >= since ? now - since : 0; }

    } // namespace time

    // =============================================================================
    // Interval Timer
    // =============================================================================

    // Driven by an explicit clock value so owners can be stepped deterministically
    struct IntervalTimer {
        u64 interval_ms = 0;
        u64 last_tick_ms = 0;

        IntervalTimer() = default;

        IntervalTimer(u64 interval, u64 now) : interval_ms(interval), last_tick_ms(now) {}

        [[nodiscard]] auto should_tick(u64 now) -> boolean {
            if (time::elapsed_ms(last_tick_ms, now) >= interval_ms) {
                last_tick_ms = now;
                return true;
            }
            return false;
        }

        [[nodiscard]] auto remaining_ms(u64 now) const -> u64 {
            u64 elapsed = time::elapsed_ms(last_tick_ms, now);
            return elapsed >= interval_ms ? 0 : interval_ms - elapsed;
        }

        auto members() noexcept { return std::tie(interval_ms, last_tick_ms); }
        auto members() const noexcept { return std::tie(interval_ms, last_tick_ms); }
    };

} // namespace tunlink
