#include "snowcity/core/key_bindings.hpp"

namespace snowcity {

std::string_view inputActionName(InputAction action) {
    switch (action) {
        case InputAction::Forward:     return "forward";
        case InputAction::Backward:    return "backward";
        case InputAction::RotateLeft:  return "left";
        case InputAction::RotateRight: return "right";
        case InputAction::Jump:        return "jump";
    }
    return "unknown";
}

const std::vector<KeyBinding>& defaultKeyBindings() {
    static const std::vector<KeyBinding> bindings = {
        {InputAction::Forward,     KEY_W},
        {InputAction::Backward,    KEY_S},
        {InputAction::RotateLeft,  KEY_A},
        {InputAction::RotateRight, KEY_D},
        {InputAction::Jump,        KEY_SPACE},
    };
    return bindings;
}

std::optional<InputAction> actionForKey(int keyCode) {
    for (const auto& binding : defaultKeyBindings()) {
        if (binding.keyCode == keyCode) {
            return binding.action;
        }
    }
    return std::nullopt;
}

}  // namespace snowcity
