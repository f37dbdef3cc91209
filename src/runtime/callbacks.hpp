#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gym_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/observation_contract.hpp"

namespace compgym::runtime {

// Hooks around episode and step boundaries. Returning an error stops the
// rollout that invoked the hook.
class Callback {
public:
    virtual ~Callback() = default;

    virtual core::errors::Status on_episode_start() { return core::errors::ok(); }

    // `step_index` is 1-based.
    virtual core::errors::Status on_step(const protocol::Observation& /*observation*/,
                                         const protocol::Action& /*action*/,
                                         double /*reward*/,
                                         const nlohmann::json& /*info*/,
                                         bool /*done*/,
                                         std::size_t /*step_index*/) {
        return core::errors::ok();
    }

    virtual core::errors::Status on_episode_end(
        const std::optional<std::string>& /*episode_name*/) {
        return core::errors::ok();
    }
};

// Invokes registered callbacks in registration order. The first failure
// stops dispatch and is returned to the caller.
class CallbackBus {
public:
    void register_callback(std::shared_ptr<Callback> callback);
    std::size_t size() const { return callbacks_.size(); }

    core::errors::Status on_episode_start();
    core::errors::Status on_step(const protocol::Observation& observation,
                                 const protocol::Action& action, double reward,
                                 const nlohmann::json& info, bool done,
                                 std::size_t step_index);
    core::errors::Status on_episode_end(const std::optional<std::string>& episode_name);

private:
    std::vector<std::shared_ptr<Callback>> callbacks_;
};

// Writes one DEBUG line per step and INFO lines at episode boundaries.
class LoggingCallback : public Callback {
public:
    core::errors::Status on_episode_start() override;
    core::errors::Status on_step(const protocol::Observation& observation,
                                 const protocol::Action& action, double reward,
                                 const nlohmann::json& info, bool done,
                                 std::size_t step_index) override;
    core::errors::Status on_episode_end(
        const std::optional<std::string>& episode_name) override;

private:
    std::size_t steps_ = 0;
    double total_reward_ = 0.0;
};

}  // namespace compgym::runtime
