#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "core/errors/gym_errors.hpp"
#include "protocol/observation_contract.hpp"
#include "runtime/agent.hpp"
#include "runtime/agent_pool.hpp"
#include "runtime/callbacks.hpp"
#include "runtime/environment.hpp"
#include "session/episode.hpp"
#include "session/episode_factory.hpp"

namespace compgym::runtime {

struct RolloutResult {
    std::string episode_id;
    std::unique_ptr<session::Episode> episode;
    std::size_t steps = 0;
    double total_reward = 0.0;
    bool done = false;
    bool cancelled = false;
};

// Runs one agent against one environment, recording every step.
//
// Each recorded Step holds the observation the agent acted on, the action
// and the reward it earned. A step that fails records nothing and aborts the
// rollout with its error. on_episode_end fires on every exit path once
// on_episode_start has succeeded, and the environment is closed at the end.
class RolloutDriver {
public:
    RolloutDriver(Environment& env, Agent& agent, session::EpisodeFactory episode_factory,
                  CallbackBus& callbacks);

    // Named episodes are also saved to save_dir/<name>.json when save_dir is set.
    void set_save_dir(std::filesystem::path save_dir) { save_dir_ = std::move(save_dir); }

    core::errors::Result<RolloutResult> run_episode(
        std::size_t max_steps, const std::optional<std::string>& episode_name = std::nullopt,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr);

private:
    core::errors::Status run_loop(session::Episode& episode, RolloutResult& result,
                                  protocol::Observation observation, std::size_t max_steps,
                                  const std::shared_ptr<std::atomic_bool>& cancel_token);

    Environment& env_;
    Agent& agent_;
    session::EpisodeFactory episode_factory_;
    CallbackBus& callbacks_;
    std::optional<std::filesystem::path> save_dir_;
};

struct PoolRolloutResult {
    std::map<std::string, RolloutResult> episodes;
    std::size_t ticks = 0;
};

// Drives every environment in `envs` with the agent of the same id in
// `pool`, one tick at a time. Environments that report done leave the active
// set; their agents receive a reward of 0 afterwards so the pool always sees
// its full key set.
class PoolRolloutDriver {
public:
    PoolRolloutDriver(std::map<std::string, Environment*> envs, AgentPool& pool,
                      session::EpisodeFactory episode_factory);

    core::errors::Result<PoolRolloutResult> run(std::size_t max_ticks);

private:
    std::map<std::string, Environment*> envs_;
    AgentPool& pool_;
    session::EpisodeFactory episode_factory_;
};

}  // namespace compgym::runtime
