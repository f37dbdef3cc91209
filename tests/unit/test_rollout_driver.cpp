#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/episode_id.hpp"
#include "core/errors/gym_errors.hpp"
#include "runtime/agent.hpp"
#include "runtime/agent_pool.hpp"
#include "runtime/callbacks.hpp"
#include "runtime/environment.hpp"
#include "runtime/rollout_driver.hpp"
#include "session/in_memory_episode.hpp"

namespace {

using compgym::core::config::generate_episode_id;
using compgym::core::errors::get_error;
using compgym::core::errors::get_value;
using compgym::core::errors::is_error;
using compgym::core::errors::Result;
using compgym::core::errors::Status;
using compgym::runtime::Agent;
using compgym::runtime::AgentPool;
using compgym::runtime::Callback;
using compgym::runtime::CallbackBus;
using compgym::runtime::Environment;
using compgym::runtime::EnvironmentState;
using compgym::runtime::PoolRolloutDriver;
using compgym::runtime::RolloutDriver;
using compgym::session::Episode;
using compgym::session::EpisodeFactory;
using compgym::session::InMemoryEpisode;

namespace protocol = compgym::protocol;

class TempWorkspace {
public:
    TempWorkspace()
        : path_(std::filesystem::current_path() /
                (".tmp_rollout_driver_" + generate_episode_id())) {
        std::filesystem::create_directories(path_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Screenshot payload is the tick counter, so recorded observations show
// which tick they came from. Reward is 1 per step.
class CountingEnvironment : public Environment {
public:
    explicit CountingEnvironment(std::size_t done_after, std::size_t fail_at = 0)
        : done_after_(done_after), fail_at_(fail_at) {}

    std::size_t resets = 0;
    std::size_t closes = 0;
    std::size_t executed = 0;

protected:
    Result<protocol::Observation> get_observation() override {
        return protocol::Observation{
            protocol::ScreenshotObservation{std::to_string(ticks_), "png"}};
    }

    bool execute_action(const protocol::Action&) override {
        if (fail_at_ != 0 && ticks_ + 1 == fail_at_) {
            return false;
        }
        ++ticks_;
        ++executed;
        return true;
    }

    double get_reward(const protocol::Action&) override { return 1.0; }
    bool get_done(const protocol::Action&) override { return ticks_ >= done_after_; }

    void on_reset() override {
        ticks_ = 0;
        ++resets;
    }
    void on_close() override { ++closes; }

private:
    std::size_t done_after_;
    std::size_t fail_at_;
    std::size_t ticks_ = 0;
};

class TypingAgent : public Agent {
public:
    std::size_t resets = 0;
    std::vector<std::string> seen;
    double rewards = 0.0;

    void reset() override { ++resets; }

    protocol::Action act(const protocol::Observation& observation) override {
        const auto& screenshot = std::get<protocol::ScreenshotObservation>(observation);
        seen.push_back(screenshot.screenshot);
        return protocol::TypeTextAction{"t" + screenshot.screenshot};
    }

    void update(double reward) override { rewards += reward; }
};

class TraceCallback : public Callback {
public:
    explicit TraceCallback(std::shared_ptr<std::vector<std::string>> trace)
        : trace_(std::move(trace)) {}

    Status on_episode_start() override {
        trace_->push_back("start");
        return compgym::core::errors::ok();
    }

    Status on_step(const protocol::Observation& observation, const protocol::Action&, double,
                   const nlohmann::json&, bool done, std::size_t step_index) override {
        const auto& screenshot = std::get<protocol::ScreenshotObservation>(observation);
        trace_->push_back("step" + std::to_string(step_index) + ":" + screenshot.screenshot +
                          (done ? ":done" : ""));
        return compgym::core::errors::ok();
    }

    Status on_episode_end(const std::optional<std::string>& episode_name) override {
        trace_->push_back("end:" + episode_name.value_or("-"));
        return compgym::core::errors::ok();
    }

private:
    std::shared_ptr<std::vector<std::string>> trace_;
};

// Accepts `capacity` steps, then refuses with step_write_failed.
class BoundedEpisode : public InMemoryEpisode {
public:
    explicit BoundedEpisode(std::size_t capacity) : capacity_(capacity) {}

    Status push(const protocol::Step& step) override {
        if (num_steps() >= capacity_) {
            return compgym::core::errors::GymError{
                compgym::core::errors::ErrorCategory::Storage, "episode is full",
                "step_write_failed"};
        }
        return InMemoryEpisode::push(step);
    }

private:
    std::size_t capacity_;
};

EpisodeFactory memory_factory() {
    return [](const std::string&) -> Result<std::unique_ptr<Episode>> {
        return std::unique_ptr<Episode>(std::make_unique<InMemoryEpisode>());
    };
}

std::string screenshot_of(const protocol::Step& step) {
    return std::get<protocol::ScreenshotObservation>(step.observation).screenshot;
}

TEST(RolloutDriverTest, RecordsPreActionObservationsUntilDone) {
    CountingEnvironment env(3);
    TypingAgent agent;
    CallbackBus bus;
    auto trace = std::make_shared<std::vector<std::string>>();
    bus.register_callback(std::make_shared<TraceCallback>(trace));

    RolloutDriver driver(env, agent, memory_factory(), bus);
    auto result = driver.run_episode(10, std::string("demo"));
    ASSERT_FALSE(is_error(result));
    const auto& rollout = get_value(result);

    EXPECT_EQ(rollout.episode_id, "demo");
    EXPECT_EQ(rollout.steps, 3u);
    EXPECT_TRUE(rollout.done);
    EXPECT_FALSE(rollout.cancelled);
    EXPECT_DOUBLE_EQ(rollout.total_reward, 3.0);
    ASSERT_EQ(rollout.episode->num_steps(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        auto step = rollout.episode->get(i);
        ASSERT_FALSE(is_error(step));
        EXPECT_EQ(screenshot_of(get_value(step)), std::to_string(i));
    }

    EXPECT_EQ(*trace, (std::vector<std::string>{"start", "step1:1", "step2:2",
                                                "step3:3:done", "end:demo"}));
    EXPECT_EQ(agent.resets, 1u);
    EXPECT_DOUBLE_EQ(agent.rewards, 3.0);
    EXPECT_EQ(env.closes, 1u);
    EXPECT_EQ(env.state(), EnvironmentState::Closed);
}

TEST(RolloutDriverTest, StopsAtMaxSteps) {
    CountingEnvironment env(100);
    TypingAgent agent;
    CallbackBus bus;
    RolloutDriver driver(env, agent, memory_factory(), bus);

    auto result = driver.run_episode(4);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).steps, 4u);
    EXPECT_FALSE(get_value(result).done);
    EXPECT_FALSE(get_value(result).episode_id.empty());
}

TEST(RolloutDriverTest, FailedStepRecordsNothingAndStillEndsEpisode) {
    CountingEnvironment env(100, 3);
    TypingAgent agent;
    CallbackBus bus;
    auto trace = std::make_shared<std::vector<std::string>>();
    bus.register_callback(std::make_shared<TraceCallback>(trace));
    RolloutDriver driver(env, agent, memory_factory(), bus);

    auto result = driver.run_episode(10, std::string("broken"));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "action_execution_failed");
    EXPECT_EQ(env.executed, 2u);
    EXPECT_EQ(*trace,
              (std::vector<std::string>{"start", "step1:1", "step2:2", "end:broken"}));
    EXPECT_EQ(env.closes, 1u);
}

TEST(RolloutDriverTest, AgentLearnsOnlyFromRecordedSteps) {
    CountingEnvironment env(100);
    TypingAgent agent;
    CallbackBus bus;
    EpisodeFactory bounded = [](const std::string&) -> Result<std::unique_ptr<Episode>> {
        return std::unique_ptr<Episode>(std::make_unique<BoundedEpisode>(2));
    };
    RolloutDriver driver(env, agent, bounded, bus);

    auto result = driver.run_episode(10);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "step_write_failed");
    EXPECT_EQ(env.executed, 3u);
    EXPECT_DOUBLE_EQ(agent.rewards, 2.0);
}

TEST(RolloutDriverTest, CancelTokenStopsBeforeNextStep) {
    CountingEnvironment env(100);
    TypingAgent agent;
    CallbackBus bus;
    RolloutDriver driver(env, agent, memory_factory(), bus);

    auto cancel = std::make_shared<std::atomic_bool>(true);
    auto result = driver.run_episode(10, std::nullopt, cancel);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
    EXPECT_EQ(get_value(result).steps, 0u);
    EXPECT_TRUE(agent.seen.empty());
}

TEST(RolloutDriverTest, SavesNamedEpisodes) {
    TempWorkspace workspace;
    CountingEnvironment env(2);
    TypingAgent agent;
    CallbackBus bus;
    RolloutDriver driver(env, agent, memory_factory(), bus);
    driver.set_save_dir(workspace.path());

    auto result = driver.run_episode(10, std::string("saved"));
    ASSERT_FALSE(is_error(result));

    std::ifstream in(workspace.path() / "saved.json");
    ASSERT_TRUE(in.is_open());
    const auto document = nlohmann::json::parse(in);
    ASSERT_EQ(document.at("steps").size(), 2u);
    EXPECT_EQ(document.at("steps")[1].at("action").at("text"), "t1");
}

TEST(RolloutDriverTest, FactoryFailureLeavesEnvironmentUntouched) {
    CountingEnvironment env(2);
    TypingAgent agent;
    CallbackBus bus;
    EpisodeFactory failing = [](const std::string&) -> Result<std::unique_ptr<Episode>> {
        return compgym::core::errors::GymError{compgym::core::errors::ErrorCategory::Storage,
                                               "no storage", "episode_exists"};
    };
    RolloutDriver driver(env, agent, failing, bus);

    auto result = driver.run_episode(3);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "episode_exists");
    EXPECT_EQ(env.resets, 0u);
}

AgentPool typing_pool(const std::vector<std::string>& ids) {
    return AgentPool([]() { return std::make_unique<TypingAgent>(); }, ids);
}

TEST(PoolRolloutDriverTest, FinishedEnvironmentsStopStepping) {
    CountingEnvironment fast(1);
    CountingEnvironment slow(3);
    auto pool = typing_pool({"0", "1"});
    PoolRolloutDriver driver({{"0", &fast}, {"1", &slow}}, pool, memory_factory());

    auto result = driver.run(10);
    ASSERT_FALSE(is_error(result));
    const auto& pool_result = get_value(result);
    EXPECT_EQ(pool_result.ticks, 3u);
    EXPECT_EQ(pool_result.episodes.at("0").steps, 1u);
    EXPECT_EQ(pool_result.episodes.at("1").steps, 3u);
    EXPECT_TRUE(pool_result.episodes.at("0").done);
    EXPECT_EQ(fast.executed, 1u);
    EXPECT_EQ(fast.closes, 1u);
    EXPECT_EQ(slow.closes, 1u);

    auto zero = pool.get_agent("0");
    ASSERT_FALSE(is_error(zero));
    EXPECT_DOUBLE_EQ(static_cast<TypingAgent*>(get_value(zero))->rewards, 1.0);
    EXPECT_EQ(pool_result.episodes.at("0").episode_id.substr(
                  pool_result.episodes.at("0").episode_id.size() - 2),
              "-0");
}

TEST(PoolRolloutDriverTest, RejectsMismatchedIds) {
    CountingEnvironment env(1);
    auto pool = typing_pool({"0", "1"});
    PoolRolloutDriver driver({{"0", &env}}, pool, memory_factory());

    auto result = driver.run(5);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "key_mismatch");
    EXPECT_EQ(env.resets, 0u);
}

}  // namespace
