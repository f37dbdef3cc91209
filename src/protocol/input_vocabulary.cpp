#include "protocol/input_vocabulary.hpp"

#include <algorithm>
#include <cctype>

namespace compgym::protocol {

namespace {

struct KeyName {
    KeyboardKey key;
    const char* wire;
};

constexpr KeyName kKeyNames[] = {
    {KeyboardKey::Enter, "enter"},
    {KeyboardKey::Tab, "tab"},
    {KeyboardKey::Space, "space"},
    {KeyboardKey::Backspace, "backspace"},
    {KeyboardKey::Delete, "delete"},
    {KeyboardKey::Escape, "escape"},
    {KeyboardKey::Home, "home"},
    {KeyboardKey::End, "end"},
    {KeyboardKey::PageUp, "pageup"},
    {KeyboardKey::PageDown, "pagedown"},
    {KeyboardKey::Up, "up"},
    {KeyboardKey::Down, "down"},
    {KeyboardKey::Left, "left"},
    {KeyboardKey::Right, "right"},
    {KeyboardKey::Shift, "shift"},
    {KeyboardKey::Ctrl, "ctrl"},
    {KeyboardKey::LeftCtrl, "lctrl"},
    {KeyboardKey::RightCtrl, "rctrl"},
    {KeyboardKey::Alt, "alt"},
    {KeyboardKey::LeftAlt, "lalt"},
    {KeyboardKey::RightAlt, "ralt"},
    {KeyboardKey::Meta, "meta"},
    {KeyboardKey::LeftMeta, "lmeta"},
    {KeyboardKey::RightMeta, "rmeta"},
    {KeyboardKey::F1, "f1"},
    {KeyboardKey::F2, "f2"},
    {KeyboardKey::F3, "f3"},
    {KeyboardKey::F4, "f4"},
    {KeyboardKey::F5, "f5"},
    {KeyboardKey::F6, "f6"},
    {KeyboardKey::F7, "f7"},
    {KeyboardKey::F8, "f8"},
    {KeyboardKey::F9, "f9"},
    {KeyboardKey::F10, "f10"},
    {KeyboardKey::F11, "f11"},
    {KeyboardKey::F12, "f12"},
    {KeyboardKey::A, "a"},
    {KeyboardKey::B, "b"},
    {KeyboardKey::C, "c"},
    {KeyboardKey::D, "d"},
    {KeyboardKey::E, "e"},
    {KeyboardKey::F, "f"},
    {KeyboardKey::G, "g"},
    {KeyboardKey::H, "h"},
    {KeyboardKey::I, "i"},
    {KeyboardKey::J, "j"},
    {KeyboardKey::K, "k"},
    {KeyboardKey::L, "l"},
    {KeyboardKey::M, "m"},
    {KeyboardKey::N, "n"},
    {KeyboardKey::O, "o"},
    {KeyboardKey::P, "p"},
    {KeyboardKey::Q, "q"},
    {KeyboardKey::R, "r"},
    {KeyboardKey::S, "s"},
    {KeyboardKey::T, "t"},
    {KeyboardKey::U, "u"},
    {KeyboardKey::V, "v"},
    {KeyboardKey::W, "w"},
    {KeyboardKey::X, "x"},
    {KeyboardKey::Y, "y"},
    {KeyboardKey::Z, "z"},
    {KeyboardKey::Num0, "0"},
    {KeyboardKey::Num1, "1"},
    {KeyboardKey::Num2, "2"},
    {KeyboardKey::Num3, "3"},
    {KeyboardKey::Num4, "4"},
    {KeyboardKey::Num5, "5"},
    {KeyboardKey::Num6, "6"},
    {KeyboardKey::Num7, "7"},
    {KeyboardKey::Num8, "8"},
    {KeyboardKey::Num9, "9"},
};

std::string normalize(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    std::string value = text.substr(first, last - first + 1);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

}  // namespace

std::string to_string(const KeyboardKey key) {
    for (const auto& entry : kKeyNames) {
        if (entry.key == key) {
            return entry.wire;
        }
    }
    return "unknown";
}

std::string to_string(const MouseButton button) {
    switch (button) {
        case MouseButton::Left:
            return "left";
        case MouseButton::Middle:
            return "middle";
        case MouseButton::Right:
            return "right";
        default:
            return "unknown";
    }
}

std::optional<KeyboardKey> key_from_string(const std::string& text) {
    const std::string wire = normalize(text);
    for (const auto& entry : kKeyNames) {
        if (wire == entry.wire) {
            return entry.key;
        }
    }
    return std::nullopt;
}

std::optional<MouseButton> button_from_string(const std::string& text) {
    const std::string wire = normalize(text);
    for (const auto button : all_mouse_buttons()) {
        if (wire == to_string(button)) {
            return button;
        }
    }
    return std::nullopt;
}

bool is_valid_key(const std::string& text) {
    return key_from_string(text).has_value();
}

bool is_valid_button(const std::string& text) {
    return button_from_string(text).has_value();
}

bool is_character_key(const KeyboardKey key) {
    return static_cast<int>(key) >= static_cast<int>(KeyboardKey::A) &&
           static_cast<int>(key) <= static_cast<int>(KeyboardKey::Num9);
}

const std::vector<KeyboardKey>& all_keyboard_keys() {
    static const std::vector<KeyboardKey> keys = [] {
        std::vector<KeyboardKey> out;
        for (const auto& entry : kKeyNames) {
            out.push_back(entry.key);
        }
        return out;
    }();
    return keys;
}

const std::vector<MouseButton>& all_mouse_buttons() {
    static const std::vector<MouseButton> buttons = {
        MouseButton::Left, MouseButton::Middle, MouseButton::Right};
    return buttons;
}

}  // namespace compgym::protocol
