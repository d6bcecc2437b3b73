#include "snowcity/core/animation_state.hpp"
#include <algorithm>
#include <cmath>

namespace snowcity {

std::string_view animationClipName(AnimationState state) {
    switch (state) {
        case AnimationState::Idle: return "idle";
        case AnimationState::Walk: return "walk";
        case AnimationState::Run:  return "run";
        case AnimationState::Jump: return "jump";
    }
    return "idle";
}

AnimationStateMachine::TransitionTable AnimationStateMachine::defaultTable() {
    TransitionTable table;
    table[static_cast<size_t>(AnimationState::Idle)] = {LoopMode::Repeat, 0.12f, 1.2f};
    table[static_cast<size_t>(AnimationState::Walk)] = {LoopMode::Repeat, 0.12f, 1.2f};
    table[static_cast<size_t>(AnimationState::Run)]  = {LoopMode::Repeat, 0.18f, 1.2f};
    table[static_cast<size_t>(AnimationState::Jump)] = {LoopMode::OnceClamp, 0.5f, 0.3f};
    return table;
}

AnimationStateMachine::AnimationStateMachine(const TransitionTable& table)
    : table_(table) {}

void AnimationStateMachine::setClipDuration(AnimationState state, float seconds) {
    durations_[static_cast<size_t>(state)] = std::max(0.0f, seconds);
}

float AnimationStateMachine::clipDuration(AnimationState state) const {
    return durations_[static_cast<size_t>(state)];
}

bool AnimationStateMachine::transitionTo(AnimationState state) {
    if (state == current_) return false;

    // Outgoing clip keeps its playhead and fades out
    previous_ = current_;
    previousTime_ = currentTime_;

    current_ = state;
    currentTime_ = 0.0f;
    finished_ = false;

    const auto& cfg = config(state);
    if (cfg.blendDuration > 0.0f) {
        weight_ = 0.0f;
    } else {
        weight_ = 1.0f;
        previous_.reset();
    }
    return true;
}

float AnimationStateMachine::stepClip(AnimationState state, float time, float mixerDt,
                                      bool* finished) const {
    const auto& cfg = config(state);
    float duration = clipDuration(state);
    float t = time + mixerDt * cfg.playbackRate;

    if (cfg.loop == LoopMode::OnceClamp) {
        if (t >= duration) {
            if (finished) *finished = true;
            return duration;
        }
        return t;
    }

    if (duration <= 0.0f) {
        return 0.0f;
    }
    return std::fmod(t, duration);
}

void AnimationStateMachine::advance(float dt) {
    float mixerDt = dt * MIXER_TIME_SCALE;

    currentTime_ = stepClip(current_, currentTime_, mixerDt, &finished_);

    if (previous_) {
        previousTime_ = stepClip(*previous_, previousTime_, mixerDt, nullptr);

        float blendDuration = config(current_).blendDuration;
        weight_ = std::min(1.0f, weight_ + dt / blendDuration);
        if (weight_ >= 1.0f) {
            previous_.reset();
            previousTime_ = 0.0f;
        }
    }
}

AnimationBlend AnimationStateMachine::blend() const {
    AnimationBlend b;
    b.current = current_;
    b.currentTime = currentTime_;
    b.previous = previous_;
    b.previousTime = previousTime_;
    b.weight = weight_;
    return b;
}

}  // namespace snowcity
