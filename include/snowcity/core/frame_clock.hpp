#pragma once

/**
 * @file frame_clock.hpp
 * @brief Frame delta source and the wall clock used by snow sway
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace snowcity {

/// Milliseconds on some fixed epoch. Injected so tests can freeze time.
using WallClock = std::function<double()>;

/// Milliseconds since the Unix epoch from the system clock
[[nodiscard]] WallClock systemWallClock();

// ============================================================================
// FrameClock - Monotonic delta between successive ticks
// ============================================================================

class FrameClock {
public:
    using Clock = std::chrono::steady_clock;

    FrameClock();

    /// Seconds since the previous tick (or since construction/reset).
    /// Not clamped.
    float tick();

    /// Restart timing from now
    void reset();

    [[nodiscard]] float lastDelta() const { return lastDelta_; }
    [[nodiscard]] uint64_t tickCount() const { return tickCount_; }

private:
    Clock::time_point last_;
    float lastDelta_ = 0.0f;
    uint64_t tickCount_ = 0;
};

}  // namespace snowcity
