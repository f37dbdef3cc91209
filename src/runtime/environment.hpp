#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gym_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/observation_contract.hpp"
#include "protocol/step_contract.hpp"

namespace compgym::runtime {

enum class EnvironmentState {
    Uninitialized,
    Active,
    Closed
};

std::string to_string(EnvironmentState state);

// Single-agent perceive/act loop. Subclasses supply the hooks; the base owns
// the state machine:
//   Uninitialized --reset--> Active --step--> Active --close--> Closed
// reset() also re-activates a closed environment. close() is a no-op unless
// the environment is active.
class Environment {
public:
    virtual ~Environment() = default;

    core::errors::Result<protocol::Observation> reset();

    // A failed action produces action_execution_failed and no outcome; the
    // reward, done and info hooks are not consulted.
    core::errors::Result<protocol::StepOutcome> step(const protocol::Action& action);

    void close();

    EnvironmentState state() const { return state_; }
    bool active() const { return state_ == EnvironmentState::Active; }

protected:
    virtual core::errors::Result<protocol::Observation> get_observation() = 0;
    // Returns false when the backend did not perform the action.
    virtual bool execute_action(const protocol::Action& action) = 0;
    virtual double get_reward(const protocol::Action& action) = 0;
    virtual bool get_done(const protocol::Action& action) = 0;
    virtual nlohmann::json get_info(const protocol::Action& action);

    virtual void on_reset() {}
    virtual void on_close() {}

private:
    EnvironmentState state_ = EnvironmentState::Uninitialized;
};

}  // namespace compgym::runtime
