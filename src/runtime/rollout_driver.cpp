#include "runtime/rollout_driver.hpp"

#include <set>
#include <utility>
#include <vector>
#include "core/config/episode_id.hpp"
#include "core/logging/logger.hpp"

namespace compgym::runtime {

using core::errors::ErrorCategory;
using core::errors::GymError;

RolloutDriver::RolloutDriver(Environment& env, Agent& agent,
                             session::EpisodeFactory episode_factory,
                             CallbackBus& callbacks)
    : env_(env),
      agent_(agent),
      episode_factory_(std::move(episode_factory)),
      callbacks_(callbacks) {}

core::errors::Result<RolloutResult> RolloutDriver::run_episode(
    const std::size_t max_steps, const std::optional<std::string>& episode_name,
    std::shared_ptr<std::atomic_bool> cancel_token) {
    RolloutResult result;
    result.episode_id = episode_name.value_or(core::config::generate_episode_id());

    auto& logger = core::logging::Logger::get();
    logger.set_episode_id(result.episode_id);

    auto created = episode_factory_(result.episode_id);
    if (core::errors::is_error(created)) {
        logger.set_episode_id("");
        return core::errors::get_error(created);
    }
    auto episode = std::move(core::errors::get_value(created));

    agent_.reset();
    auto observation = env_.reset();
    if (core::errors::is_error(observation)) {
        env_.close();
        logger.set_episode_id("");
        return core::errors::get_error(observation);
    }

    auto started = callbacks_.on_episode_start();
    if (core::errors::is_error(started)) {
        env_.close();
        logger.set_episode_id("");
        return core::errors::get_error(started);
    }
    LOG_INFO("RolloutDriver: episode started (max_steps=" + std::to_string(max_steps) + ")");

    auto looped = run_loop(*episode, result, std::move(core::errors::get_value(observation)),
                           max_steps, cancel_token);
    auto ended = callbacks_.on_episode_end(episode_name);
    env_.close();

    if (core::errors::is_error(looped)) {
        LOG_ERROR("RolloutDriver: episode aborted after " + std::to_string(result.steps) +
                  " steps: " + core::errors::get_error(looped).message);
        logger.set_episode_id("");
        return core::errors::get_error(looped);
    }
    if (core::errors::is_error(ended)) {
        logger.set_episode_id("");
        return core::errors::get_error(ended);
    }

    if (episode_name.has_value() && save_dir_.has_value()) {
        auto saved = episode->save(save_dir_.value() / (episode_name.value() + ".json"));
        if (core::errors::is_error(saved)) {
            logger.set_episode_id("");
            return core::errors::get_error(saved);
        }
    }

    LOG_INFO("RolloutDriver: episode finished after " + std::to_string(result.steps) +
             " steps, total reward " + std::to_string(result.total_reward));
    logger.set_episode_id("");
    result.episode = std::move(episode);
    return std::move(result);
}

core::errors::Status RolloutDriver::run_loop(
    session::Episode& episode, RolloutResult& result, protocol::Observation observation,
    const std::size_t max_steps, const std::shared_ptr<std::atomic_bool>& cancel_token) {
    for (std::size_t step_index = 1; step_index <= max_steps; ++step_index) {
        if (cancel_token && cancel_token->load()) {
            LOG_WARN("RolloutDriver: cancelled before step " + std::to_string(step_index));
            result.cancelled = true;
            break;
        }

        const protocol::Action action = agent_.act(observation);
        auto stepped = env_.step(action);
        if (core::errors::is_error(stepped)) {
            return core::errors::get_error(stepped);
        }
        auto& outcome = core::errors::get_value(stepped);

        protocol::Step step;
        step.observation = observation;
        step.action = action;
        step.reward = outcome.reward;
        step.info = outcome.info;
        auto pushed = episode.push(step);
        if (core::errors::is_error(pushed)) {
            return pushed;
        }
        agent_.update(outcome.reward);
        ++result.steps;
        result.total_reward += outcome.reward;
        result.done = outcome.done;

        auto notified = callbacks_.on_step(outcome.observation, action, outcome.reward,
                                           outcome.info, outcome.done, step_index);
        if (core::errors::is_error(notified)) {
            return notified;
        }

        observation = std::move(outcome.observation);
        if (outcome.done) {
            break;
        }
    }
    return core::errors::ok();
}

PoolRolloutDriver::PoolRolloutDriver(std::map<std::string, Environment*> envs,
                                     AgentPool& pool,
                                     session::EpisodeFactory episode_factory)
    : envs_(std::move(envs)), pool_(pool), episode_factory_(std::move(episode_factory)) {}

core::errors::Result<PoolRolloutResult> PoolRolloutDriver::run(const std::size_t max_ticks) {
    const auto ids = pool_.agent_ids();
    bool keys_match = ids.size() == envs_.size();
    for (const auto& id : ids) {
        keys_match = keys_match && envs_.find(id) != envs_.end();
    }
    if (!keys_match) {
        return GymError{ErrorCategory::Lookup,
                        "Environment ids do not match the agent pool ids",
                        "key_mismatch"};
    }

    auto close_all = [this]() {
        for (auto& entry : envs_) {
            entry.second->close();
        }
    };

    const auto run_id = core::config::generate_episode_id();
    PoolRolloutResult result;
    std::map<std::string, protocol::Observation> observations;
    std::set<std::string> active;

    pool_.reset();
    for (const auto& entry : envs_) {
        auto created = episode_factory_(run_id + "-" + entry.first);
        if (core::errors::is_error(created)) {
            close_all();
            return core::errors::get_error(created);
        }
        auto observation = entry.second->reset();
        if (core::errors::is_error(observation)) {
            close_all();
            return core::errors::get_error(observation);
        }

        RolloutResult& episode_result = result.episodes[entry.first];
        episode_result.episode_id = run_id + "-" + entry.first;
        episode_result.episode = std::move(core::errors::get_value(created));
        observations[entry.first] = std::move(core::errors::get_value(observation));
        active.insert(entry.first);
    }
    LOG_INFO("PoolRolloutDriver: started " + std::to_string(envs_.size()) + " episodes");

    while (result.ticks < max_ticks && !active.empty()) {
        auto acted = pool_.act(observations);
        if (core::errors::is_error(acted)) {
            close_all();
            return core::errors::get_error(acted);
        }
        const auto& actions = core::errors::get_value(acted);

        std::map<std::string, double> rewards;
        std::vector<std::string> finished;
        for (const auto& id : ids) {
            rewards[id] = 0.0;
            if (active.count(id) == 0) {
                continue;
            }

            const auto& action = actions.at(id);
            auto stepped = envs_.at(id)->step(action);
            if (core::errors::is_error(stepped)) {
                close_all();
                return core::errors::get_error(stepped);
            }
            auto& outcome = core::errors::get_value(stepped);

            RolloutResult& episode_result = result.episodes.at(id);
            protocol::Step step;
            step.observation = observations.at(id);
            step.action = action;
            step.reward = outcome.reward;
            step.info = outcome.info;
            auto pushed = episode_result.episode->push(step);
            if (core::errors::is_error(pushed)) {
                close_all();
                return core::errors::get_error(pushed);
            }
            ++episode_result.steps;
            episode_result.total_reward += outcome.reward;
            episode_result.done = outcome.done;

            rewards[id] = outcome.reward;
            observations[id] = std::move(outcome.observation);
            if (outcome.done) {
                finished.push_back(id);
            }
        }

        auto updated = pool_.update(rewards);
        if (core::errors::is_error(updated)) {
            close_all();
            return core::errors::get_error(updated);
        }
        for (const auto& id : finished) {
            active.erase(id);
            LOG_DEBUG("PoolRolloutDriver: '" + id + "' done after " +
                      std::to_string(result.episodes.at(id).steps) + " steps");
        }
        ++result.ticks;
    }

    close_all();
    LOG_INFO("PoolRolloutDriver: finished after " + std::to_string(result.ticks) + " ticks");
    return std::move(result);
}

}  // namespace compgym::runtime
