#pragma once

#include <functional>
#include <memory>
#include <string>
#include "core/config/rollout_config.hpp"
#include "core/errors/gym_errors.hpp"
#include "session/episode.hpp"

namespace compgym::session {

// Creates the episode for one rollout, given its id.
using EpisodeFactory =
    std::function<core::errors::Result<std::unique_ptr<Episode>>(const std::string&)>;

// Memory storage ignores episode_dir. Durable storage writes each episode to
// episode_dir/<id> in the configured encoding.
EpisodeFactory make_episode_factory(const core::config::RolloutConfig& config);

}  // namespace compgym::session
