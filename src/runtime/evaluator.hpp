#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/gym_errors.hpp"
#include "runtime/callbacks.hpp"
#include "session/episode.hpp"

namespace compgym::runtime {

struct EvaluationResult {
    bool passed = false;
    // Fraction of mandate clauses the episode satisfied.
    double score = 0.0;
    std::vector<std::string> failed_clauses;
};

// Scores a completed episode against a mandate and accumulates metrics.
class Evaluator {
public:
    virtual ~Evaluator() = default;

    virtual core::errors::Result<EvaluationResult> evaluate_episode(
        const session::Episode& episode, const std::string& mandate) = 0;
    virtual std::map<std::string, double> get_metrics() const = 0;
};

// Mandates are ';'-separated clauses:
//   min_reward=<float>  total reward is at least the value
//   max_steps=<int>     the episode has at most that many steps
//   typed=<text>        the typed text contains <text>
//   final=<key>         the last action presses <key>
// A mandate with any other segment is free text as a whole, matched
// case-insensitively against everything the agent typed. An empty mandate
// passes.
class MandateEvaluator : public Evaluator {
public:
    MandateEvaluator();

    // Registers a callback that counts live steps on `bus`.
    void attach(CallbackBus& bus);

    core::errors::Result<EvaluationResult> evaluate_episode(
        const session::Episode& episode, const std::string& mandate) override;
    std::map<std::string, double> get_metrics() const override;

private:
    class LiveStepCounter;

    std::shared_ptr<LiveStepCounter> live_steps_;
    std::size_t episodes_evaluated_ = 0;
    std::size_t episodes_passed_ = 0;
};

}  // namespace compgym::runtime
