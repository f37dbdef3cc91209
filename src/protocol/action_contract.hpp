#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "protocol/input_vocabulary.hpp"

namespace compgym::protocol {

    // Primitive actions. Each carries only the fields it needs.
    struct KeyDownAction { KeyboardKey key = KeyboardKey::Enter; };
    struct KeyUpAction { KeyboardKey key = KeyboardKey::Enter; };
    struct TypeTextAction { std::string text; };
    struct MouseMoveAction {
        int x = 0;
        int y = 0;
        double move_duration_s = 0.5;
    };
    struct MouseButtonDownAction { MouseButton button = MouseButton::Left; };
    struct MouseButtonUpAction { MouseButton button = MouseButton::Left; };
    struct MouseScrollAction { double amount = 0.0; };

    // Compound actions, expanded into primitives by the environment.
    struct KeyPressAction {
        KeyboardKey key = KeyboardKey::Enter;
        double duration_s = 0.1;
    };
    struct HotkeyAction { std::vector<KeyboardKey> keys; };
    struct ClickAction {
        int x = 0;
        int y = 0;
        MouseButton button = MouseButton::Left;
    };
    struct DoubleClickAction {
        int x = 0;
        int y = 0;
        MouseButton button = MouseButton::Left;
    };
    struct DragAction {
        int start_x = 0;
        int start_y = 0;
        int end_x = 0;
        int end_y = 0;
        MouseButton button = MouseButton::Left;
    };
    struct ShellCommandAction {
        std::string command;
        // Unset means the command runs until it finishes.
        std::optional<std::uint32_t> timeout_ms;
    };

    using Action = std::variant<
        KeyDownAction,
        KeyUpAction,
        TypeTextAction,
        MouseMoveAction,
        MouseButtonDownAction,
        MouseButtonUpAction,
        MouseScrollAction,
        KeyPressAction,
        HotkeyAction,
        ClickAction,
        DoubleClickAction,
        DragAction,
        ShellCommandAction
    >;

    // Discriminator used on the wire, e.g. "keyboard_key_down".
    std::string action_type(const Action& action);

} // namespace compgym::protocol
