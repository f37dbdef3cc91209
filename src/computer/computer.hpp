#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/gym_errors.hpp"

namespace compgym::computer {

// Capabilities a backend driver must provide. Keys and buttons cross this
// boundary as backend-native strings; translation to and from the canonical
// vocabulary happens in the environment through the backend's mapping table.
// The inject_* calls return false when the backend did not perform the input.
class Computer {
public:
    virtual ~Computer() = default;

    // Name of the registered mapping table to translate through.
    virtual std::string backend_name() const = 0;

    // Base64-encoded PNG of the current screen.
    virtual core::errors::Result<std::string> capture_screenshot() = 0;
    virtual core::errors::Result<std::pair<int, int>> cursor_position() = 0;
    virtual core::errors::Result<std::vector<std::string>> pressed_buttons() = 0;
    virtual core::errors::Result<std::vector<std::string>> pressed_keys() = 0;

    virtual bool inject_key(const std::string& native_key, bool down) = 0;
    virtual bool inject_text(const std::string& text) = 0;
    virtual bool inject_mouse_move(int x, int y, double duration_s) = 0;
    virtual bool inject_mouse_button(const std::string& native_button, bool down) = 0;
    virtual bool inject_scroll(double amount) = 0;
    virtual bool run_shell_command(const std::string& command,
                                   std::optional<std::uint32_t> timeout_ms) = 0;
};

}  // namespace compgym::computer
