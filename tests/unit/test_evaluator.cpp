#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/gym_errors.hpp"
#include "runtime/callbacks.hpp"
#include "runtime/evaluator.hpp"
#include "session/in_memory_episode.hpp"

namespace {

using compgym::core::errors::get_error;
using compgym::core::errors::get_value;
using compgym::core::errors::is_error;
using compgym::runtime::CallbackBus;
using compgym::runtime::MandateEvaluator;
using compgym::session::InMemoryEpisode;

namespace protocol = compgym::protocol;

void record(InMemoryEpisode& episode, const protocol::Action& action, double reward) {
    compgym::protocol::Step step;
    step.observation = protocol::ScreenshotObservation{"", "png"};
    step.action = action;
    step.reward = reward;
    ASSERT_FALSE(is_error(episode.push(step)));
}

InMemoryEpisode login_episode() {
    InMemoryEpisode episode;
    record(episode, protocol::TypeTextAction{"Hello "}, 0.5);
    record(episode, protocol::TypeTextAction{"World"}, 0.5);
    record(episode, protocol::KeyPressAction{protocol::KeyboardKey::Enter, 0.0}, 1.0);
    return episode;
}

TEST(MandateEvaluatorTest, StructuredClausesPass) {
    MandateEvaluator evaluator;
    auto result = evaluator.evaluate_episode(
        login_episode(), "min_reward=2; max_steps=3; typed=World; final=enter");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).passed);
    EXPECT_DOUBLE_EQ(get_value(result).score, 1.0);
    EXPECT_TRUE(get_value(result).failed_clauses.empty());
}

TEST(MandateEvaluatorTest, ReportsFailedClauses) {
    MandateEvaluator evaluator;
    auto result =
        evaluator.evaluate_episode(login_episode(), "min_reward=5;max_steps=2;typed=World;final=tab");
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).passed);
    EXPECT_DOUBLE_EQ(get_value(result).score, 0.25);
    EXPECT_EQ(get_value(result).failed_clauses,
              (std::vector<std::string>{"min_reward=5", "max_steps=2", "final=tab"}));
}

TEST(MandateEvaluatorTest, FreeTextMatchesTypedTextIgnoringCase) {
    MandateEvaluator evaluator;
    auto hit = evaluator.evaluate_episode(login_episode(), "hello world");
    ASSERT_FALSE(is_error(hit));
    EXPECT_TRUE(get_value(hit).passed);

    auto miss = evaluator.evaluate_episode(login_episode(), "goodbye");
    ASSERT_FALSE(is_error(miss));
    EXPECT_FALSE(get_value(miss).passed);
    EXPECT_DOUBLE_EQ(get_value(miss).score, 0.0);
}

TEST(MandateEvaluatorTest, SemicolonsInFreeTextDoNotSplitIt) {
    InMemoryEpisode episode;
    record(episode, protocol::TypeTextAction{"Open the file; save it"}, 1.0);

    MandateEvaluator evaluator;
    auto whole = evaluator.evaluate_episode(episode, "open the file; save it");
    ASSERT_FALSE(is_error(whole));
    EXPECT_TRUE(get_value(whole).passed);

    auto reordered = evaluator.evaluate_episode(episode, "save it; open the file");
    ASSERT_FALSE(is_error(reordered));
    EXPECT_FALSE(get_value(reordered).passed);
    EXPECT_DOUBLE_EQ(get_value(reordered).score, 0.0);
    EXPECT_EQ(get_value(reordered).failed_clauses,
              (std::vector<std::string>{"save it; open the file"}));

    record(episode, protocol::TypeTextAction{" typed=Open; save it"}, 0.0);
    auto mixed = evaluator.evaluate_episode(episode, "typed=Open; save it");
    ASSERT_FALSE(is_error(mixed));
    EXPECT_TRUE(get_value(mixed).passed);
}

TEST(MandateEvaluatorTest, EmptyMandatePasses) {
    MandateEvaluator evaluator;
    auto result = evaluator.evaluate_episode(InMemoryEpisode(), " ; ");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).passed);
}

TEST(MandateEvaluatorTest, RejectsMalformedClauses) {
    MandateEvaluator evaluator;
    auto bad_number = evaluator.evaluate_episode(login_episode(), "min_reward=lots");
    ASSERT_TRUE(is_error(bad_number));
    EXPECT_EQ(get_error(bad_number).code, "invalid_mandate");

    auto bad_key = evaluator.evaluate_episode(login_episode(), "final=hyper");
    ASSERT_TRUE(is_error(bad_key));
    EXPECT_EQ(get_error(bad_key).code, "invalid_mandate");

    EXPECT_DOUBLE_EQ(evaluator.get_metrics().at("episodes_evaluated"), 0.0);
}

TEST(MandateEvaluatorTest, AccumulatesMetrics) {
    MandateEvaluator evaluator;
    CallbackBus bus;
    evaluator.attach(bus);

    const protocol::Observation observation = protocol::ScreenshotObservation{"", "png"};
    const protocol::Action action = protocol::TypeTextAction{"x"};
    for (std::size_t i = 1; i <= 3; ++i) {
        ASSERT_FALSE(is_error(
            bus.on_step(observation, action, 0.0, nlohmann::json::object(), false, i)));
    }

    ASSERT_FALSE(is_error(evaluator.evaluate_episode(login_episode(), "typed=Hello")));
    ASSERT_FALSE(is_error(evaluator.evaluate_episode(login_episode(), "typed=nope")));

    const auto metrics = evaluator.get_metrics();
    EXPECT_DOUBLE_EQ(metrics.at("episodes_evaluated"), 2.0);
    EXPECT_DOUBLE_EQ(metrics.at("episodes_passed"), 1.0);
    EXPECT_DOUBLE_EQ(metrics.at("pass_rate"), 0.5);
    EXPECT_DOUBLE_EQ(metrics.at("live_steps_observed"), 3.0);
}

}  // namespace
