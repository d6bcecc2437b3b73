#pragma once

/**
 * @file key_bindings.hpp
 * @brief Fixed physical-key bindings for character control
 *
 * Key codes are GLFW key codes (platform-neutral integers). Core cannot
 * include GLFW headers, so constants are stored as raw ints.
 */

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace snowcity {

// GLFW key code constants (stable across versions)
constexpr int KEY_SPACE = 32;
constexpr int KEY_A = 65;
constexpr int KEY_D = 68;
constexpr int KEY_S = 83;
constexpr int KEY_W = 87;

/// Semantic input actions
enum class InputAction : uint8_t {
    Forward,
    Backward,
    RotateLeft,
    RotateRight,
    Jump
};

[[nodiscard]] std::string_view inputActionName(InputAction action);

/// A single key binding: action -> key code
struct KeyBinding {
    InputAction action;
    int keyCode;
};

/// The bindings in effect (W/S/A/D/Space). Not remappable.
[[nodiscard]] const std::vector<KeyBinding>& defaultKeyBindings();

/// Action bound to a key code, if any
[[nodiscard]] std::optional<InputAction> actionForKey(int keyCode);

}  // namespace snowcity
