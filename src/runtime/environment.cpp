#include "runtime/environment.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace compgym::runtime {

using core::errors::ErrorCategory;
using core::errors::GymError;

std::string to_string(const EnvironmentState state) {
    switch (state) {
        case EnvironmentState::Uninitialized:
            return "uninitialized";
        case EnvironmentState::Active:
            return "active";
        case EnvironmentState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

nlohmann::json Environment::get_info(const protocol::Action&) {
    return nlohmann::json::object();
}

core::errors::Result<protocol::Observation> Environment::reset() {
    const auto previous = state_;
    on_reset();
    state_ = EnvironmentState::Active;
    LOG_DEBUG("Environment: " + to_string(previous) + " -> active");
    return get_observation();
}

core::errors::Result<protocol::StepOutcome> Environment::step(
    const protocol::Action& action) {
    if (state_ != EnvironmentState::Active) {
        return GymError{ErrorCategory::Input,
                        "Environment is " + to_string(state_) + ", call reset() first.",
                        "environment_inactive"};
    }

    if (!execute_action(action)) {
        return GymError{ErrorCategory::Execution,
                        "Backend did not execute action '" +
                            protocol::action_type(action) + "'",
                        "action_execution_failed"};
    }

    auto observation = get_observation();
    if (core::errors::is_error(observation)) {
        return core::errors::get_error(observation);
    }

    protocol::StepOutcome outcome;
    outcome.observation = std::move(core::errors::get_value(observation));
    outcome.reward = get_reward(action);
    outcome.done = get_done(action);
    outcome.info = get_info(action);
    return outcome;
}

void Environment::close() {
    if (state_ != EnvironmentState::Active) {
        return;
    }
    on_close();
    state_ = EnvironmentState::Closed;
    LOG_DEBUG("Environment: active -> closed");
}

}  // namespace compgym::runtime
