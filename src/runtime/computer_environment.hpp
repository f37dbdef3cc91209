#pragma once

#include <functional>
#include <string>
#include <utility>
#include "computer/computer.hpp"
#include "input/backend_mapping.hpp"
#include "runtime/environment.hpp"
#include "runtime/observation_slot.hpp"

namespace compgym::runtime {

// Environment over a Computer backend. Canonical keys and buttons are
// translated through the backend's mapping table; compound actions are
// expanded into primitive injections, and any failing primitive fails the
// whole action.
class ComputerEnvironment : public Environment {
public:
    using RewardFn = std::function<double(const protocol::Action&)>;
    using DoneFn = std::function<bool(const protocol::Action&)>;

    ComputerEnvironment(computer::Computer& computer,
                        const input::MappingRegistry& mappings,
                        protocol::ObservationKind observation_kind =
                            protocol::ObservationKind::Screenshot);
    ~ComputerEnvironment() override;

    ComputerEnvironment(const ComputerEnvironment&) = delete;
    ComputerEnvironment& operator=(const ComputerEnvironment&) = delete;

    // Defaults: reward 0, never done.
    void set_reward_fn(RewardFn reward_fn) { reward_fn_ = std::move(reward_fn); }
    void set_done_fn(DoneFn done_fn) { done_fn_ = std::move(done_fn); }

    // Every observation taken is also published to `slot`, if set.
    void set_preview_slot(ObservationSlot* slot) { preview_slot_ = slot; }

    protocol::ObservationKind observation_kind() const { return observation_kind_; }

protected:
    core::errors::Result<protocol::Observation> get_observation() override;
    bool execute_action(const protocol::Action& action) override;
    double get_reward(const protocol::Action& action) override;
    bool get_done(const protocol::Action& action) override;
    nlohmann::json get_info(const protocol::Action& action) override;
    void on_close() override;

private:
    bool press_key(protocol::KeyboardKey key, bool down);
    bool press_button(protocol::MouseButton button, bool down);
    bool click(int x, int y, protocol::MouseButton button);

    core::errors::Result<protocol::Observation> capture();

    computer::Computer& computer_;
    const input::MappingRegistry& mappings_;
    std::string backend_;
    protocol::ObservationKind observation_kind_;
    RewardFn reward_fn_;
    DoneFn done_fn_;
    ObservationSlot* preview_slot_ = nullptr;
};

}  // namespace compgym::runtime
