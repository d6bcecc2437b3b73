#pragma once

/**
 * @file animation_state.hpp
 * @brief Character animation FSM with time-domain cross-fades
 *
 * Exactly one state is current. Switching states starts the new clip at
 * time 0 and fades the old one out over the new state's blend duration.
 * The outgoing clip keeps playing while it fades.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace snowcity {

enum class AnimationState : uint8_t {
    Idle,
    Walk,
    Run,
    Jump
};

constexpr size_t ANIMATION_STATE_COUNT = 4;

/// Clip name used to look the state up in a loaded model
[[nodiscard]] std::string_view animationClipName(AnimationState state);

enum class LoopMode : uint8_t {
    Repeat,     ///< Wrap to the start at the end of the clip
    OnceClamp   ///< Play once and hold the last frame
};

/// Per-state entry of the transition table
struct AnimationStateConfig {
    LoopMode loop = LoopMode::Repeat;
    float playbackRate = 1.0f;    // Multiplier on mixer time
    float blendDuration = 1.2f;   // Seconds to fade in when entering this state
};

/// Snapshot of the current mix, pushed to the renderer each tick
struct AnimationBlend {
    AnimationState current = AnimationState::Idle;
    float currentTime = 0.0f;
    std::optional<AnimationState> previous;   // Clip fading out, if any
    float previousTime = 0.0f;
    float weight = 1.0f;                      // Weight of current; previous gets 1 - weight
};

class AnimationStateMachine {
public:
    using TransitionTable = std::array<AnimationStateConfig, ANIMATION_STATE_COUNT>;

    /// Characters are authored at 30 fps and mixed at 60
    static constexpr float MIXER_TIME_SCALE = 30.0f / 60.0f;

    [[nodiscard]] static TransitionTable defaultTable();

    explicit AnimationStateMachine(const TransitionTable& table = defaultTable());

    /// Clip length in seconds (0 = static pose)
    void setClipDuration(AnimationState state, float seconds);
    [[nodiscard]] float clipDuration(AnimationState state) const;

    /// Switch to a state. No-op (returns false) if it is already current.
    bool transitionTo(AnimationState state);

    /// Advance clip times and the blend weight by dt seconds
    void advance(float dt);

    [[nodiscard]] AnimationState current() const { return current_; }
    [[nodiscard]] std::optional<AnimationState> previous() const { return previous_; }
    [[nodiscard]] float currentTime() const { return currentTime_; }
    [[nodiscard]] float blendWeight() const { return weight_; }
    [[nodiscard]] bool isBlending() const { return previous_.has_value(); }

    /// True once a OnceClamp clip reached its end
    [[nodiscard]] bool currentFinished() const { return finished_; }

    [[nodiscard]] const AnimationStateConfig& config(AnimationState state) const {
        return table_[static_cast<size_t>(state)];
    }

    [[nodiscard]] AnimationBlend blend() const;

private:
    [[nodiscard]] float stepClip(AnimationState state, float time, float mixerDt, bool* finished) const;

    TransitionTable table_;
    std::array<float, ANIMATION_STATE_COUNT> durations_{};

    AnimationState current_ = AnimationState::Idle;
    float currentTime_ = 0.0f;
    bool finished_ = false;

    std::optional<AnimationState> previous_;
    float previousTime_ = 0.0f;
    float weight_ = 1.0f;
};

}  // namespace snowcity
