#include "snowcity/core/input_mapper.hpp"

namespace snowcity {

bool InputMapper::onKeyDown(int keyCode) {
    auto action = actionForKey(keyCode);
    if (!action) return false;
    setAction(*action, true);
    return true;
}

bool InputMapper::onKeyUp(int keyCode) {
    auto action = actionForKey(keyCode);
    if (!action) return false;
    setAction(*action, false);
    return true;
}

void InputMapper::setAction(InputAction action, bool down) {
    switch (action) {
        case InputAction::Forward:
            keys_.forward = down;
            break;
        case InputAction::Backward:
            keys_.backward = down;
            break;
        case InputAction::RotateLeft:
            keys_.left = down;
            break;
        case InputAction::RotateRight:
            keys_.right = down;
            break;
        case InputAction::Jump:
            // Only the press edge arms the latch; auto-repeat does not
            if (down && !keys_.jump) {
                jumpPending_ = true;
            } else if (!down) {
                jumpPending_ = false;
            }
            keys_.jump = down;
            break;
    }
}

PlayerIntent InputMapper::poll(bool airborne, bool jumpAllowed) {
    PlayerIntent intent;
    intent.moveAxis = (keys_.forward ? 1 : 0) - (keys_.backward ? 1 : 0);
    intent.rotateAxis = (keys_.left ? 1 : 0) - (keys_.right ? 1 : 0);

    if (jumpPending_ && !airborne && jumpAllowed) {
        intent.jumpRequested = true;
        jumpPending_ = false;
    }

    intent.animation = animationTarget(keys_, airborne);
    return intent;
}

void InputMapper::reset() {
    keys_ = KeyState{};
    jumpPending_ = false;
}

AnimationState InputMapper::animationTarget(const KeyState& keys, bool airborne) {
    if (airborne) return AnimationState::Jump;
    if (keys.forward) return AnimationState::Run;
    if (keys.backward) return AnimationState::Walk;
    return AnimationState::Idle;
}

}  // namespace snowcity
