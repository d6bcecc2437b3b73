#include "snowcity/core/frame_clock.hpp"

namespace snowcity {

WallClock systemWallClock() {
    return [] {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double, std::milli>(now).count();
    };
}

FrameClock::FrameClock() : last_(Clock::now()) {}

float FrameClock::tick() {
    auto now = Clock::now();
    lastDelta_ = std::chrono::duration<float>(now - last_).count();
    last_ = now;
    ++tickCount_;
    return lastDelta_;
}

void FrameClock::reset() {
    last_ = Clock::now();
    lastDelta_ = 0.0f;
}

}  // namespace snowcity
