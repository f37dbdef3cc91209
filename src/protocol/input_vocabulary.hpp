#pragma once
#include <optional>
#include <string>
#include <vector>

namespace compgym::protocol {

    // Canonical key identifiers. Every backend mapping is defined in terms of
    // these values; their wire strings never change meaning across backends.
    enum class KeyboardKey {
        // Special keys
        Enter, Tab, Space, Backspace, Delete, Escape, Home, End, PageUp, PageDown,
        // Arrow keys
        Up, Down, Left, Right,
        // Modifiers, generic and sided
        Shift, Ctrl, LeftCtrl, RightCtrl, Alt, LeftAlt, RightAlt, Meta, LeftMeta, RightMeta,
        // Function keys
        F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
        // Letters
        A, B, C, D, E, F, G, H, I, J, K, L, M,
        N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
        // Digits
        Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9
    };

    enum class MouseButton {
        Left,
        Middle,
        Right
    };

    // Wire strings, e.g. "enter", "lctrl", "pageup", "a", "0".
    std::string to_string(KeyboardKey key);
    std::string to_string(MouseButton button);

    // Parses a wire string. Input is trimmed and lower-cased first.
    std::optional<KeyboardKey> key_from_string(const std::string& text);
    std::optional<MouseButton> button_from_string(const std::string& text);

    bool is_valid_key(const std::string& text);
    bool is_valid_button(const std::string& text);

    // Letters and digits. These map to backends by literal value.
    bool is_character_key(KeyboardKey key);

    const std::vector<KeyboardKey>& all_keyboard_keys();
    const std::vector<MouseButton>& all_mouse_buttons();

} // namespace compgym::protocol
