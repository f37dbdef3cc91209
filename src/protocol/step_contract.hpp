#pragma once
#include <nlohmann/json.hpp>
#include "protocol/action_contract.hpp"
#include "protocol/observation_contract.hpp"

namespace compgym::protocol {

    // One observation/action/reward/info record. Episodes store and hand out
    // copies, so a Step is never modified after it is recorded.
    struct Step {
        Observation observation;
        Action action;
        double reward = 0.0;
        nlohmann::json info = nlohmann::json::object();
    };

    // What Environment::step hands back to the caller.
    struct StepOutcome {
        Observation observation;
        double reward = 0.0;
        bool done = false;
        nlohmann::json info = nlohmann::json::object();
    };

} // namespace compgym::protocol
