#include "runtime/callbacks.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace compgym::runtime {

void CallbackBus::register_callback(std::shared_ptr<Callback> callback) {
    if (callback == nullptr) {
        LOG_WARN("CallbackBus: ignoring null callback");
        return;
    }
    callbacks_.push_back(std::move(callback));
}

core::errors::Status CallbackBus::on_episode_start() {
    for (const auto& callback : callbacks_) {
        auto status = callback->on_episode_start();
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status CallbackBus::on_step(const protocol::Observation& observation,
                                          const protocol::Action& action,
                                          const double reward, const nlohmann::json& info,
                                          const bool done, const std::size_t step_index) {
    for (const auto& callback : callbacks_) {
        auto status = callback->on_step(observation, action, reward, info, done, step_index);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status CallbackBus::on_episode_end(
    const std::optional<std::string>& episode_name) {
    for (const auto& callback : callbacks_) {
        auto status = callback->on_episode_end(episode_name);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status LoggingCallback::on_episode_start() {
    steps_ = 0;
    total_reward_ = 0.0;
    LOG_INFO("Episode started");
    return core::errors::ok();
}

core::errors::Status LoggingCallback::on_step(const protocol::Observation& observation,
                                              const protocol::Action& action,
                                              const double reward,
                                              const nlohmann::json& /*info*/,
                                              const bool done,
                                              const std::size_t step_index) {
    ++steps_;
    total_reward_ += reward;
    LOG_DEBUG("Step " + std::to_string(step_index) + ": " + protocol::action_type(action) +
              " -> " + protocol::observation_type(observation) +
              ", reward=" + std::to_string(reward) + (done ? ", done" : ""));
    return core::errors::ok();
}

core::errors::Status LoggingCallback::on_episode_end(
    const std::optional<std::string>& episode_name) {
    LOG_INFO("Episode " + episode_name.value_or("<unnamed>") + " ended after " +
             std::to_string(steps_) + " steps, total reward " +
             std::to_string(total_reward_));
    return core::errors::ok();
}

}  // namespace compgym::runtime
