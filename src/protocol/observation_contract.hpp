#pragma once
#include <string>
#include <variant>
#include <vector>
#include "protocol/input_vocabulary.hpp"

namespace compgym::protocol {

    struct ScreenshotObservation {
        std::string screenshot;  // base64-encoded image
        std::string format = "png";
    };

    struct MouseStateObservation {
        int x = 0;
        int y = 0;
        std::vector<MouseButton> pressed_buttons;
    };

    struct KeyboardStateObservation {
        std::vector<KeyboardKey> pressed_keys;
    };

    using Observation = std::variant<
        ScreenshotObservation,
        MouseStateObservation,
        KeyboardStateObservation
    >;

    enum class ObservationKind {
        Screenshot,
        MouseState,
        KeyboardState
    };

    inline std::string to_string(const ObservationKind kind) {
        switch (kind) {
            case ObservationKind::Screenshot:
                return "screenshot";
            case ObservationKind::MouseState:
                return "mouse_state";
            case ObservationKind::KeyboardState:
                return "keyboard_state";
            default:
                return "unknown";
        }
    }

    inline std::string observation_type(const Observation& observation) {
        return to_string(static_cast<ObservationKind>(observation.index()));
    }

} // namespace compgym::protocol
