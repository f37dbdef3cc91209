#include "protocol/step_codec.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace compgym::protocol {

using core::errors::ErrorCategory;
using core::errors::GymError;
using nlohmann::json;

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

GymError decode_error(const std::string& message) {
    return GymError{ErrorCategory::Storage, "Unable to decode step: " + message,
                    "step_decode_failed"};
}

KeyboardKey parse_key(const json& value) {
    const auto key = key_from_string(value.get<std::string>());
    if (!key.has_value()) {
        throw std::invalid_argument("unknown key: " + value.get<std::string>());
    }
    return key.value();
}

MouseButton parse_button(const json& payload) {
    if (!payload.contains("button")) {
        return MouseButton::Left;
    }
    const auto button = button_from_string(payload.at("button").get<std::string>());
    if (!button.has_value()) {
        throw std::invalid_argument("unknown button: " +
                                    payload.at("button").get<std::string>());
    }
    return button.value();
}

json keys_to_json(const std::vector<KeyboardKey>& keys) {
    json out = json::array();
    for (const auto key : keys) {
        out.push_back(to_string(key));
    }
    return out;
}

std::vector<KeyboardKey> keys_from_json(const json& payload) {
    std::vector<KeyboardKey> keys;
    for (const auto& value : payload) {
        keys.push_back(parse_key(value));
    }
    return keys;
}

Action parse_action(const json& payload) {
    const std::string type = payload.at("action_type").get<std::string>();
    if (type == "keyboard_key_down") {
        return KeyDownAction{parse_key(payload.at("key"))};
    }
    if (type == "keyboard_key_release") {
        return KeyUpAction{parse_key(payload.at("key"))};
    }
    if (type == "type") {
        return TypeTextAction{payload.at("text").get<std::string>()};
    }
    if (type == "mouse_move") {
        return MouseMoveAction{payload.at("x").get<int>(), payload.at("y").get<int>(),
                               payload.value("move_duration", 0.5)};
    }
    if (type == "mouse_button_down") {
        return MouseButtonDownAction{parse_button(payload)};
    }
    if (type == "mouse_button_up") {
        return MouseButtonUpAction{parse_button(payload)};
    }
    if (type == "mouse_scroll") {
        return MouseScrollAction{payload.at("amount").get<double>()};
    }
    if (type == "keyboard_key_press") {
        return KeyPressAction{parse_key(payload.at("key")), payload.value("duration", 0.1)};
    }
    if (type == "keyboard_hotkey") {
        return HotkeyAction{keys_from_json(payload.at("keys"))};
    }
    if (type == "click") {
        return ClickAction{payload.at("x").get<int>(), payload.at("y").get<int>(),
                           parse_button(payload)};
    }
    if (type == "double_click") {
        return DoubleClickAction{payload.at("x").get<int>(), payload.at("y").get<int>(),
                                 parse_button(payload)};
    }
    if (type == "drag") {
        return DragAction{payload.at("start_x").get<int>(), payload.at("start_y").get<int>(),
                          payload.at("end_x").get<int>(), payload.at("end_y").get<int>(),
                          parse_button(payload)};
    }
    if (type == "command") {
        ShellCommandAction action;
        action.command = payload.at("command").get<std::string>();
        if (payload.contains("timeout_ms") && !payload.at("timeout_ms").is_null()) {
            action.timeout_ms = payload.at("timeout_ms").get<std::uint32_t>();
        }
        return action;
    }
    throw std::invalid_argument("unknown action_type: " + type);
}

Observation parse_observation(const json& payload) {
    const std::string type = payload.at("observation_type").get<std::string>();
    if (type == "screenshot") {
        return ScreenshotObservation{payload.at("screenshot").get<std::string>(),
                                     payload.value("format", std::string("png"))};
    }
    if (type == "mouse_state") {
        MouseStateObservation observation;
        const auto& position = payload.at("position");
        observation.x = position.at(0).get<int>();
        observation.y = position.at(1).get<int>();
        for (const auto& value : payload.at("buttons")) {
            const auto button = button_from_string(value.get<std::string>());
            if (!button.has_value()) {
                throw std::invalid_argument("unknown button: " + value.get<std::string>());
            }
            observation.pressed_buttons.push_back(button.value());
        }
        return observation;
    }
    if (type == "keyboard_state") {
        return KeyboardStateObservation{keys_from_json(payload.at("keys"))};
    }
    throw std::invalid_argument("unknown observation_type: " + type);
}

}  // namespace

std::string action_type(const Action& action) {
    return action_to_json(action).at("action_type").get<std::string>();
}

std::string to_string(const StepEncoding encoding) {
    switch (encoding) {
        case StepEncoding::Json:
            return "json";
        case StepEncoding::MessagePack:
            return "msgpack";
        default:
            return "unknown";
    }
}

std::string file_extension(const StepEncoding encoding) {
    return "." + to_string(encoding);
}

json action_to_json(const Action& action) {
    return std::visit(
        [](const auto& a) -> json {
            using T = std::decay_t<decltype(a)>;
            json payload;
            if constexpr (std::is_same_v<T, KeyDownAction>) {
                payload["action_type"] = "keyboard_key_down";
                payload["key"] = to_string(a.key);
            } else if constexpr (std::is_same_v<T, KeyUpAction>) {
                payload["action_type"] = "keyboard_key_release";
                payload["key"] = to_string(a.key);
            } else if constexpr (std::is_same_v<T, TypeTextAction>) {
                payload["action_type"] = "type";
                payload["text"] = a.text;
            } else if constexpr (std::is_same_v<T, MouseMoveAction>) {
                payload["action_type"] = "mouse_move";
                payload["x"] = a.x;
                payload["y"] = a.y;
                payload["move_duration"] = a.move_duration_s;
            } else if constexpr (std::is_same_v<T, MouseButtonDownAction>) {
                payload["action_type"] = "mouse_button_down";
                payload["button"] = to_string(a.button);
            } else if constexpr (std::is_same_v<T, MouseButtonUpAction>) {
                payload["action_type"] = "mouse_button_up";
                payload["button"] = to_string(a.button);
            } else if constexpr (std::is_same_v<T, MouseScrollAction>) {
                payload["action_type"] = "mouse_scroll";
                payload["amount"] = a.amount;
            } else if constexpr (std::is_same_v<T, KeyPressAction>) {
                payload["action_type"] = "keyboard_key_press";
                payload["key"] = to_string(a.key);
                payload["duration"] = a.duration_s;
            } else if constexpr (std::is_same_v<T, HotkeyAction>) {
                payload["action_type"] = "keyboard_hotkey";
                payload["keys"] = keys_to_json(a.keys);
            } else if constexpr (std::is_same_v<T, ClickAction>) {
                payload["action_type"] = "click";
                payload["x"] = a.x;
                payload["y"] = a.y;
                payload["button"] = to_string(a.button);
            } else if constexpr (std::is_same_v<T, DoubleClickAction>) {
                payload["action_type"] = "double_click";
                payload["x"] = a.x;
                payload["y"] = a.y;
                payload["button"] = to_string(a.button);
            } else if constexpr (std::is_same_v<T, DragAction>) {
                payload["action_type"] = "drag";
                payload["start_x"] = a.start_x;
                payload["start_y"] = a.start_y;
                payload["end_x"] = a.end_x;
                payload["end_y"] = a.end_y;
                payload["button"] = to_string(a.button);
            } else if constexpr (std::is_same_v<T, ShellCommandAction>) {
                payload["action_type"] = "command";
                payload["command"] = a.command;
                payload["timeout_ms"] = a.timeout_ms.has_value()
                                            ? json(a.timeout_ms.value())
                                            : json(nullptr);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action type");
            }
            return payload;
        },
        action);
}

json observation_to_json(const Observation& observation) {
    return std::visit(
        [](const auto& o) -> json {
            using T = std::decay_t<decltype(o)>;
            json payload;
            if constexpr (std::is_same_v<T, ScreenshotObservation>) {
                payload["observation_type"] = "screenshot";
                payload["screenshot"] = o.screenshot;
                payload["format"] = o.format;
            } else if constexpr (std::is_same_v<T, MouseStateObservation>) {
                payload["observation_type"] = "mouse_state";
                payload["position"] = json::array({o.x, o.y});
                json buttons = json::array();
                for (const auto button : o.pressed_buttons) {
                    buttons.push_back(to_string(button));
                }
                payload["buttons"] = buttons;
            } else if constexpr (std::is_same_v<T, KeyboardStateObservation>) {
                payload["observation_type"] = "keyboard_state";
                payload["keys"] = keys_to_json(o.pressed_keys);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled observation type");
            }
            return payload;
        },
        observation);
}

json step_to_json(const Step& step) {
    json payload;
    payload["observation"] = observation_to_json(step.observation);
    payload["action"] = action_to_json(step.action);
    payload["reward"] = step.reward;
    payload["info"] = step.info;
    return payload;
}

core::errors::Result<Action> action_from_json(const json& payload) {
    try {
        return parse_action(payload);
    } catch (const json::exception& e) {
        return decode_error(e.what());
    } catch (const std::invalid_argument& e) {
        return decode_error(e.what());
    }
}

core::errors::Result<Observation> observation_from_json(const json& payload) {
    try {
        return parse_observation(payload);
    } catch (const json::exception& e) {
        return decode_error(e.what());
    } catch (const std::invalid_argument& e) {
        return decode_error(e.what());
    }
}

core::errors::Result<Step> step_from_json(const json& payload) {
    if (!payload.is_object() || !payload.contains("observation") ||
        !payload.contains("action")) {
        return decode_error("missing observation or action");
    }

    auto observation = observation_from_json(payload.at("observation"));
    if (core::errors::is_error(observation)) {
        return core::errors::get_error(observation);
    }
    auto action = action_from_json(payload.at("action"));
    if (core::errors::is_error(action)) {
        return core::errors::get_error(action);
    }

    Step step;
    step.observation = std::move(core::errors::get_value(observation));
    step.action = std::move(core::errors::get_value(action));
    try {
        step.reward = payload.value("reward", 0.0);
        step.info = payload.value("info", json::object());
    } catch (const json::exception& e) {
        return decode_error(e.what());
    }
    return step;
}

core::errors::Status check_encodable(const Step& step) {
    if (!std::isfinite(step.reward)) {
        return GymError{ErrorCategory::Input,
                        "Step reward must be finite, got " + std::to_string(step.reward),
                        "invalid_reward"};
    }
    return core::errors::ok();
}

core::errors::Result<std::vector<std::uint8_t>> encode_step(const Step& step,
                                                            const StepEncoding encoding) {
    auto encodable = check_encodable(step);
    if (core::errors::is_error(encodable)) {
        return core::errors::get_error(encodable);
    }

    try {
        const json payload = step_to_json(step);
        if (encoding == StepEncoding::MessagePack) {
            return json::to_msgpack(payload);
        }
        const std::string text = payload.dump();
        return std::vector<std::uint8_t>(text.begin(), text.end());
    } catch (const json::exception& e) {
        return GymError{ErrorCategory::Input,
                        std::string("Unable to encode step: ") + e.what(),
                        "step_encode_failed",
                        "Text fields must be valid UTF-8."};
    }
}

core::errors::Result<Step> decode_step(const std::vector<std::uint8_t>& bytes,
                                       const StepEncoding encoding) {
    json payload;
    try {
        if (encoding == StepEncoding::MessagePack) {
            payload = json::from_msgpack(bytes);
        } else {
            payload = json::parse(bytes.begin(), bytes.end());
        }
    } catch (const json::exception& e) {
        return decode_error(e.what());
    }
    return step_from_json(payload);
}

}  // namespace compgym::protocol
