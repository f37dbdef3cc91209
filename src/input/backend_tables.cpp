#include "input/backend_tables.hpp"

#include <string>

namespace compgym::input {

using protocol::KeyboardKey;
using protocol::MouseButton;

namespace {

constexpr KeyboardKey kFunctionKeys[] = {
    KeyboardKey::F1, KeyboardKey::F2, KeyboardKey::F3,  KeyboardKey::F4,
    KeyboardKey::F5, KeyboardKey::F6, KeyboardKey::F7,  KeyboardKey::F8,
    KeyboardKey::F9, KeyboardKey::F10, KeyboardKey::F11, KeyboardKey::F12};

void add_function_keys(BackendMapping& mapping) {
    int number = 1;
    for (const auto key : kFunctionKeys) {
        mapping.keys.push_back({key, "f" + std::to_string(number++)});
    }
}

void add_arrow_keys(BackendMapping& mapping) {
    mapping.keys.push_back({KeyboardKey::Up, "up"});
    mapping.keys.push_back({KeyboardKey::Down, "down"});
    mapping.keys.push_back({KeyboardKey::Left, "left"});
    mapping.keys.push_back({KeyboardKey::Right, "right"});
}

void add_plain_buttons(BackendMapping& mapping) {
    mapping.buttons = {{MouseButton::Left, "left"},
                       {MouseButton::Middle, "middle"},
                       {MouseButton::Right, "right"}};
}

// Backends that do not tell left and right modifiers apart.
void add_unsided_modifiers(BackendMapping& mapping, const std::string& ctrl,
                           const std::string& alt, const std::string& meta) {
    mapping.keys.push_back({KeyboardKey::Shift, "shift"});
    mapping.keys.push_back({KeyboardKey::Ctrl, ctrl});
    mapping.keys.push_back({KeyboardKey::LeftCtrl, ctrl});
    mapping.keys.push_back({KeyboardKey::RightCtrl, ctrl});
    mapping.keys.push_back({KeyboardKey::Alt, alt});
    mapping.keys.push_back({KeyboardKey::LeftAlt, alt});
    mapping.keys.push_back({KeyboardKey::RightAlt, alt});
    mapping.keys.push_back({KeyboardKey::Meta, meta});
    mapping.keys.push_back({KeyboardKey::LeftMeta, meta});
    mapping.keys.push_back({KeyboardKey::RightMeta, meta});
}

}  // namespace

BackendMapping pynput_mapping() {
    BackendMapping mapping;
    mapping.backend = "pynput";
    mapping.keys = {
        {KeyboardKey::Enter, "enter"},
        {KeyboardKey::Tab, "tab"},
        {KeyboardKey::Space, "space"},
        {KeyboardKey::Backspace, "backspace"},
        {KeyboardKey::Delete, "delete"},
        {KeyboardKey::Escape, "esc"},
        {KeyboardKey::Home, "home"},
        {KeyboardKey::End, "end"},
        {KeyboardKey::PageUp, "page_up"},
        {KeyboardKey::PageDown, "page_down"},
        {KeyboardKey::Shift, "shift"},
        {KeyboardKey::Ctrl, "ctrl"},
        {KeyboardKey::LeftCtrl, "ctrl_l"},
        {KeyboardKey::RightCtrl, "ctrl_r"},
        {KeyboardKey::Alt, "alt"},
        {KeyboardKey::LeftAlt, "alt_l"},
        {KeyboardKey::RightAlt, "alt_r"},
        {KeyboardKey::Meta, "cmd"},
        {KeyboardKey::LeftMeta, "cmd_l"},
        {KeyboardKey::RightMeta, "cmd_r"},
    };
    add_arrow_keys(mapping);
    add_function_keys(mapping);
    mapping.key_aliases = {{"shift_l", KeyboardKey::Shift},
                           {"shift_r", KeyboardKey::Shift}};
    add_plain_buttons(mapping);
    return mapping;
}

BackendMapping pyautogui_mapping() {
    BackendMapping mapping;
    mapping.backend = "pyautogui";
    mapping.keys = {
        {KeyboardKey::Enter, "enter"},
        {KeyboardKey::Tab, "tab"},
        {KeyboardKey::Space, "space"},
        {KeyboardKey::Backspace, "backspace"},
        {KeyboardKey::Delete, "delete"},
        {KeyboardKey::Escape, "esc"},
        {KeyboardKey::Home, "home"},
        {KeyboardKey::End, "end"},
        {KeyboardKey::PageUp, "pageup"},
        {KeyboardKey::PageDown, "pagedown"},
        {KeyboardKey::Shift, "shift"},
        {KeyboardKey::Ctrl, "ctrl"},
        {KeyboardKey::LeftCtrl, "ctrlleft"},
        {KeyboardKey::RightCtrl, "ctrlright"},
        {KeyboardKey::Alt, "alt"},
        {KeyboardKey::LeftAlt, "altleft"},
        {KeyboardKey::RightAlt, "altright"},
        {KeyboardKey::Meta, "win"},
        {KeyboardKey::LeftMeta, "winleft"},
        {KeyboardKey::RightMeta, "winright"},
    };
    add_arrow_keys(mapping);
    add_function_keys(mapping);
    mapping.key_aliases = {{"shiftleft", KeyboardKey::Shift},
                           {"shiftright", KeyboardKey::Shift},
                           {"return", KeyboardKey::Enter},
                           {"escape", KeyboardKey::Escape}};
    add_plain_buttons(mapping);
    return mapping;
}

BackendMapping vnc_mapping() {
    BackendMapping mapping;
    mapping.backend = "vnc";
    mapping.keys = {
        {KeyboardKey::Enter, "return"},
        {KeyboardKey::Tab, "tab"},
        {KeyboardKey::Space, "space"},
        {KeyboardKey::Backspace, "backspace"},
        {KeyboardKey::Delete, "delete"},
        {KeyboardKey::Escape, "escape"},
        {KeyboardKey::Home, "home"},
        {KeyboardKey::End, "end"},
        {KeyboardKey::PageUp, "page_up"},
        {KeyboardKey::PageDown, "page_down"},
    };
    add_arrow_keys(mapping);
    add_unsided_modifiers(mapping, "control", "alt", "meta");
    add_function_keys(mapping);
    // RFB pointer button numbers.
    mapping.buttons = {{MouseButton::Left, "1"},
                       {MouseButton::Middle, "2"},
                       {MouseButton::Right, "3"}};
    return mapping;
}

BackendMapping e2b_mapping() {
    BackendMapping mapping;
    mapping.backend = "e2b";
    mapping.keys = {
        {KeyboardKey::Enter, "return"},
        {KeyboardKey::Tab, "tab"},
        {KeyboardKey::Space, "space"},
        {KeyboardKey::Backspace, "backspace"},
        {KeyboardKey::Delete, "delete"},
        {KeyboardKey::Escape, "esc"},
        {KeyboardKey::Home, "home"},
        {KeyboardKey::End, "end"},
        {KeyboardKey::PageUp, "pageup"},
        {KeyboardKey::PageDown, "pagedown"},
    };
    add_arrow_keys(mapping);
    add_unsided_modifiers(mapping, "ctrl", "alt", "win");
    add_function_keys(mapping);
    add_plain_buttons(mapping);
    return mapping;
}

BackendMapping scrapybara_mapping() {
    BackendMapping mapping;
    mapping.backend = "scrapybara";
    mapping.keys = {
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
    };
    add_arrow_keys(mapping);
    add_unsided_modifiers(mapping, "ctrl", "alt", "meta");
    add_function_keys(mapping);
    mapping.buttons = {{MouseButton::Left, "left_click"},
                       {MouseButton::Middle, "middle_click"},
                       {MouseButton::Right, "right_click"}};
    return mapping;
}

BackendMapping pigdev_mapping() {
    BackendMapping mapping;
    mapping.backend = "pigdev";
    mapping.keys = {
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
    };
    add_arrow_keys(mapping);
    add_unsided_modifiers(mapping, "ctrl", "alt", "super");
    add_function_keys(mapping);
    add_plain_buttons(mapping);
    return mapping;
}

BackendMapping daemon_mapping() {
    BackendMapping mapping;
    mapping.backend = "daemon";
    for (const auto key : protocol::all_keyboard_keys()) {
        if (!protocol::is_character_key(key)) {
            mapping.keys.push_back({key, protocol::to_string(key)});
        }
    }
    for (const auto button : protocol::all_mouse_buttons()) {
        mapping.buttons.push_back({button, protocol::to_string(button)});
    }
    return mapping;
}

}  // namespace compgym::input
