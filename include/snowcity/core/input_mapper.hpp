#pragma once

/**
 * @file input_mapper.hpp
 * @brief Raw key edges -> per-tick movement intent
 *
 * The host feeds key-down/key-up codes from its single input boundary.
 * Once per tick the simulation polls a PlayerIntent. Movement and rotation
 * are level-triggered; jump is a latch armed by a key-down edge, consumed by
 * the first poll that allows a jump, and cleared on key-up.
 */

#include "snowcity/core/animation_state.hpp"
#include "snowcity/core/key_bindings.hpp"
#include <cstdint>

namespace snowcity {

/// Semantic commands for one tick
struct PlayerIntent {
    int moveAxis = 0;       // +1 forward, -1 backward
    int rotateAxis = 0;     // +1 left (counter-clockwise), -1 right
    bool jumpRequested = false;
    AnimationState animation = AnimationState::Idle;
};

/// Raw key state, one flag per action
struct KeyState {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    bool jump = false;
};

class InputMapper {
public:
    InputMapper() = default;

    /// Dispatch a raw key edge. Returns false for unbound keys.
    bool onKeyDown(int keyCode);
    bool onKeyUp(int keyCode);

    /// Build the intent for this tick. The jump latch is consumed only when
    /// grounded and jumpAllowed; otherwise it stays armed for a later tick.
    [[nodiscard]] PlayerIntent poll(bool airborne, bool jumpAllowed = true);

    /// Release everything (e.g. window lost focus)
    void reset();

    [[nodiscard]] const KeyState& keys() const { return keys_; }
    [[nodiscard]] bool jumpPending() const { return jumpPending_; }

    /// Priority: Jump (airborne) > Run (forward) > Walk (backward) > Idle
    [[nodiscard]] static AnimationState animationTarget(const KeyState& keys, bool airborne);

private:
    void setAction(InputAction action, bool down);

    KeyState keys_;
    bool jumpPending_ = false;
};

}  // namespace snowcity
