#include "runtime/computer_environment.hpp"

#include <chrono>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace compgym::runtime {

using protocol::KeyboardKey;
using protocol::MouseButton;

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

void hold_for(const double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

}  // namespace

ComputerEnvironment::ComputerEnvironment(computer::Computer& computer,
                                         const input::MappingRegistry& mappings,
                                         const protocol::ObservationKind observation_kind)
    : computer_(computer),
      mappings_(mappings),
      backend_(computer.backend_name()),
      observation_kind_(observation_kind) {
    if (!mappings_.contains(backend_)) {
        LOG_WARN("ComputerEnvironment: no mapping table for backend '" + backend_ +
                 "', canonical wire strings will be sent as-is");
    }
}

ComputerEnvironment::~ComputerEnvironment() {
    close();
}

bool ComputerEnvironment::press_key(const KeyboardKey key, const bool down) {
    return computer_.inject_key(mappings_.to_backend(backend_, key), down);
}

bool ComputerEnvironment::press_button(const MouseButton button, const bool down) {
    return computer_.inject_mouse_button(mappings_.to_backend(backend_, button), down);
}

bool ComputerEnvironment::click(const int x, const int y, const MouseButton button) {
    return computer_.inject_mouse_move(x, y, 0.0) && press_button(button, true) &&
           press_button(button, false);
}

bool ComputerEnvironment::execute_action(const protocol::Action& action) {
    return std::visit(
        [this](const auto& value) -> bool {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, protocol::KeyDownAction>) {
                return press_key(value.key, true);
            } else if constexpr (std::is_same_v<T, protocol::KeyUpAction>) {
                return press_key(value.key, false);
            } else if constexpr (std::is_same_v<T, protocol::TypeTextAction>) {
                return computer_.inject_text(value.text);
            } else if constexpr (std::is_same_v<T, protocol::MouseMoveAction>) {
                return computer_.inject_mouse_move(value.x, value.y, value.move_duration_s);
            } else if constexpr (std::is_same_v<T, protocol::MouseButtonDownAction>) {
                return press_button(value.button, true);
            } else if constexpr (std::is_same_v<T, protocol::MouseButtonUpAction>) {
                return press_button(value.button, false);
            } else if constexpr (std::is_same_v<T, protocol::MouseScrollAction>) {
                return computer_.inject_scroll(value.amount);
            } else if constexpr (std::is_same_v<T, protocol::KeyPressAction>) {
                if (!press_key(value.key, true)) {
                    return false;
                }
                hold_for(value.duration_s);
                return press_key(value.key, false);
            } else if constexpr (std::is_same_v<T, protocol::HotkeyAction>) {
                std::vector<KeyboardKey> held;
                bool pressed_all = true;
                for (const auto key : value.keys) {
                    if (!press_key(key, true)) {
                        pressed_all = false;
                        break;
                    }
                    held.push_back(key);
                }
                // Release in reverse even after a failure so nothing stays held.
                bool released_all = true;
                for (auto it = held.rbegin(); it != held.rend(); ++it) {
                    released_all = press_key(*it, false) && released_all;
                }
                return pressed_all && released_all;
            } else if constexpr (std::is_same_v<T, protocol::ClickAction>) {
                return click(value.x, value.y, value.button);
            } else if constexpr (std::is_same_v<T, protocol::DoubleClickAction>) {
                return click(value.x, value.y, value.button) &&
                       click(value.x, value.y, value.button);
            } else if constexpr (std::is_same_v<T, protocol::DragAction>) {
                return computer_.inject_mouse_move(value.start_x, value.start_y, 0.0) &&
                       press_button(value.button, true) &&
                       computer_.inject_mouse_move(value.end_x, value.end_y, 0.5) &&
                       press_button(value.button, false);
            } else if constexpr (std::is_same_v<T, protocol::ShellCommandAction>) {
                return computer_.run_shell_command(value.command, value.timeout_ms);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action type");
            }
        },
        action);
}

core::errors::Result<protocol::Observation> ComputerEnvironment::capture() {
    switch (observation_kind_) {
        case protocol::ObservationKind::MouseState: {
            auto position = computer_.cursor_position();
            if (core::errors::is_error(position)) {
                return core::errors::get_error(position);
            }
            auto natives = computer_.pressed_buttons();
            if (core::errors::is_error(natives)) {
                return core::errors::get_error(natives);
            }
            protocol::MouseStateObservation state;
            state.x = core::errors::get_value(position).first;
            state.y = core::errors::get_value(position).second;
            for (const auto& native : core::errors::get_value(natives)) {
                if (const auto button = mappings_.button_from_backend(backend_, native)) {
                    state.pressed_buttons.push_back(*button);
                } else {
                    LOG_DEBUG("ComputerEnvironment: dropping unknown button '" + native + "'");
                }
            }
            return protocol::Observation(std::move(state));
        }
        case protocol::ObservationKind::KeyboardState: {
            auto natives = computer_.pressed_keys();
            if (core::errors::is_error(natives)) {
                return core::errors::get_error(natives);
            }
            protocol::KeyboardStateObservation state;
            for (const auto& native : core::errors::get_value(natives)) {
                if (const auto key = mappings_.key_from_backend(backend_, native)) {
                    state.pressed_keys.push_back(*key);
                } else {
                    LOG_DEBUG("ComputerEnvironment: dropping unknown key '" + native + "'");
                }
            }
            return protocol::Observation(std::move(state));
        }
        case protocol::ObservationKind::Screenshot:
        default: {
            auto screenshot = computer_.capture_screenshot();
            if (core::errors::is_error(screenshot)) {
                return core::errors::get_error(screenshot);
            }
            protocol::ScreenshotObservation shot;
            shot.screenshot = std::move(core::errors::get_value(screenshot));
            return protocol::Observation(std::move(shot));
        }
    }
}

core::errors::Result<protocol::Observation> ComputerEnvironment::get_observation() {
    auto observation = capture();
    if (!core::errors::is_error(observation) && preview_slot_ != nullptr) {
        preview_slot_->publish(core::errors::get_value(observation));
    }
    return observation;
}

double ComputerEnvironment::get_reward(const protocol::Action& action) {
    return reward_fn_ ? reward_fn_(action) : 0.0;
}

bool ComputerEnvironment::get_done(const protocol::Action& action) {
    return done_fn_ ? done_fn_(action) : false;
}

nlohmann::json ComputerEnvironment::get_info(const protocol::Action& action) {
    nlohmann::json info = nlohmann::json::object();
    info["backend"] = backend_;
    info["action_type"] = protocol::action_type(action);
    return info;
}

void ComputerEnvironment::on_close() {
    LOG_INFO("ComputerEnvironment: closing '" + backend_ + "' environment");
}

}  // namespace compgym::runtime
