#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/gym_errors.hpp"
#include "protocol/step_contract.hpp"

namespace compgym::protocol {

enum class StepEncoding {
    Json,
    MessagePack
};

std::string to_string(StepEncoding encoding);
std::string file_extension(StepEncoding encoding);

nlohmann::json action_to_json(const Action& action);
nlohmann::json observation_to_json(const Observation& observation);
nlohmann::json step_to_json(const Step& step);

core::errors::Result<Action> action_from_json(const nlohmann::json& payload);
core::errors::Result<Observation> observation_from_json(const nlohmann::json& payload);
core::errors::Result<Step> step_from_json(const nlohmann::json& payload);

// Rewards must be finite so that every encoded step decodes to an equal one.
core::errors::Status check_encodable(const Step& step);
// Fails with invalid_reward or step_encode_failed (e.g. text that is not
// valid UTF-8 under the JSON encoding).
core::errors::Result<std::vector<std::uint8_t>> encode_step(const Step& step,
                                                            StepEncoding encoding);
core::errors::Result<Step> decode_step(const std::vector<std::uint8_t>& bytes,
                                       StepEncoding encoding);

}  // namespace compgym::protocol
