#include "runtime/evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <system_error>
#include "core/logging/logger.hpp"
#include "protocol/input_vocabulary.hpp"

namespace compgym::runtime {

using core::errors::ErrorCategory;
using core::errors::GymError;

class MandateEvaluator::LiveStepCounter : public Callback {
public:
    core::errors::Status on_step(const protocol::Observation& /*observation*/,
                                 const protocol::Action& /*action*/, double /*reward*/,
                                 const nlohmann::json& /*info*/, bool /*done*/,
                                 std::size_t /*step_index*/) override {
        ++count_;
        return core::errors::ok();
    }

    std::size_t count() const { return count_; }

private:
    std::size_t count_ = 0;
};

namespace {

struct EpisodeSummary {
    std::size_t steps = 0;
    double total_reward = 0.0;
    std::string typed;
    std::optional<protocol::Action> last_action;
};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_structured_clause(const std::string& clause) {
    const auto eq = clause.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    const std::string name = trim(clause.substr(0, eq));
    return name == "min_reward" || name == "max_steps" || name == "typed" || name == "final";
}

// A mandate is a clause list only if every segment is a structured clause;
// otherwise the whole text is one free-text clause and `free_text` is set.
std::vector<std::string> split_clauses(const std::string& mandate, bool& free_text) {
    free_text = false;
    std::vector<std::string> clauses;
    std::string current;
    for (const char c : mandate) {
        if (c == ';') {
            clauses.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    clauses.push_back(trim(current));
    clauses.erase(std::remove(clauses.begin(), clauses.end(), std::string()), clauses.end());

    if (!std::all_of(clauses.begin(), clauses.end(), is_structured_clause)) {
        free_text = true;
        return {trim(mandate)};
    }
    return clauses;
}

bool presses_key(const protocol::Action& action, const protocol::KeyboardKey key) {
    if (const auto* down = std::get_if<protocol::KeyDownAction>(&action)) {
        return down->key == key;
    }
    if (const auto* press = std::get_if<protocol::KeyPressAction>(&action)) {
        return press->key == key;
    }
    if (const auto* hotkey = std::get_if<protocol::HotkeyAction>(&action)) {
        return std::find(hotkey->keys.begin(), hotkey->keys.end(), key) != hotkey->keys.end();
    }
    return false;
}

GymError invalid_clause(const std::string& clause, const std::string& reason) {
    return GymError{ErrorCategory::Input, "Invalid mandate clause '" + clause + "': " + reason,
                    "invalid_mandate"};
}

bool matches_typed_text(const std::string& text, const EpisodeSummary& summary) {
    return lowercase(summary.typed).find(lowercase(text)) != std::string::npos;
}

core::errors::Result<bool> check_clause(const std::string& clause,
                                        const EpisodeSummary& summary) {
    const auto eq = clause.find('=');
    const std::string name = eq == std::string::npos ? "" : trim(clause.substr(0, eq));
    const std::string value = eq == std::string::npos ? "" : trim(clause.substr(eq + 1));

    if (name == "min_reward") {
        try {
            std::size_t consumed = 0;
            const double threshold = std::stod(value, &consumed);
            if (consumed != value.size()) {
                return invalid_clause(clause, "expected a number");
            }
            return summary.total_reward >= threshold;
        } catch (const std::invalid_argument&) {
            return invalid_clause(clause, "expected a number");
        } catch (const std::out_of_range&) {
            return invalid_clause(clause, "number out of range");
        }
    }

    if (name == "max_steps") {
        std::size_t limit = 0;
        const char* begin = value.data();
        const char* end = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(begin, end, limit);
        if (value.empty() || ec != std::errc() || ptr != end) {
            return invalid_clause(clause, "expected a non-negative integer");
        }
        return summary.steps <= limit;
    }

    if (name == "typed") {
        return summary.typed.find(value) != std::string::npos;
    }

    if (name == "final") {
        const auto key = protocol::key_from_string(value);
        if (!key.has_value()) {
            return invalid_clause(clause, "unknown key");
        }
        return summary.last_action.has_value() && presses_key(*summary.last_action, *key);
    }

    return matches_typed_text(clause, summary);
}

}  // namespace

MandateEvaluator::MandateEvaluator() : live_steps_(std::make_shared<LiveStepCounter>()) {}

void MandateEvaluator::attach(CallbackBus& bus) {
    bus.register_callback(live_steps_);
}

core::errors::Result<EvaluationResult> MandateEvaluator::evaluate_episode(
    const session::Episode& episode, const std::string& mandate) {
    EpisodeSummary summary;
    for (const auto& step : episode.iter_steps()) {
        if (core::errors::is_error(step)) {
            return core::errors::get_error(step);
        }
        const auto& value = core::errors::get_value(step);
        ++summary.steps;
        summary.total_reward += value.reward;
        if (const auto* typed = std::get_if<protocol::TypeTextAction>(&value.action)) {
            summary.typed += typed->text;
        }
        summary.last_action = value.action;
    }

    bool free_text = false;
    const auto clauses = split_clauses(mandate, free_text);
    EvaluationResult result;
    std::size_t satisfied = 0;
    for (const auto& clause : clauses) {
        auto checked = free_text ? core::errors::Result<bool>(matches_typed_text(clause, summary))
                                 : check_clause(clause, summary);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        if (core::errors::get_value(checked)) {
            ++satisfied;
        } else {
            result.failed_clauses.push_back(clause);
        }
    }

    result.passed = result.failed_clauses.empty();
    result.score = clauses.empty() ? 1.0
                                   : static_cast<double>(satisfied) /
                                         static_cast<double>(clauses.size());

    ++episodes_evaluated_;
    if (result.passed) {
        ++episodes_passed_;
    }
    LOG_INFO("MandateEvaluator: " + std::string(result.passed ? "passed" : "failed") +
             " with score " + std::to_string(result.score));
    return result;
}

std::map<std::string, double> MandateEvaluator::get_metrics() const {
    std::map<std::string, double> metrics;
    metrics["episodes_evaluated"] = static_cast<double>(episodes_evaluated_);
    metrics["episodes_passed"] = static_cast<double>(episodes_passed_);
    metrics["pass_rate"] = episodes_evaluated_ == 0
                               ? 0.0
                               : static_cast<double>(episodes_passed_) /
                                     static_cast<double>(episodes_evaluated_);
    metrics["live_steps_observed"] = static_cast<double>(live_steps_->count());
    return metrics;
}

}  // namespace compgym::runtime
