#include "runtime/agent_pool.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace compgym::runtime {

using core::errors::ErrorCategory;
using core::errors::GymError;

namespace {

template <typename Map>
std::string join_keys(const Map& keyed) {
    std::string joined = "[";
    bool first = true;
    for (const auto& entry : keyed) {
        if (!first) {
            joined += ", ";
        }
        joined += "\"" + entry.first + "\"";
        first = false;
    }
    return joined + "]";
}

}  // namespace

AgentPool::AgentPool(AgentFactory factory, const std::vector<std::string>& initial_ids)
    : factory_(std::move(factory)), next_id_(initial_ids) {
    for (const auto& id : initial_ids) {
        agents_[id] = factory_();
    }
}

std::string AgentPool::add_agent() {
    const auto id = next_id_.next();
    agents_[id] = factory_();
    LOG_INFO("AgentPool: added agent '" + id + "' (" + std::to_string(agents_.size()) +
             " total)");
    return id;
}

void AgentPool::reset() {
    for (auto& entry : agents_) {
        entry.second->reset();
    }
}

template <typename T>
core::errors::Status AgentPool::check_keys(const std::map<std::string, T>& keyed,
                                           const std::string& what) const {
    bool same = keyed.size() == agents_.size();
    auto agent = agents_.begin();
    for (auto it = keyed.begin(); same && it != keyed.end(); ++it, ++agent) {
        same = it->first == agent->first;
    }
    if (same) {
        return core::errors::ok();
    }
    return GymError{ErrorCategory::Lookup,
                    what + " keys " + join_keys(keyed) + " do not match agent keys " +
                        join_keys(agents_),
                    "key_mismatch"};
}

core::errors::Result<std::map<std::string, protocol::Action>> AgentPool::act(
    const std::map<std::string, protocol::Observation>& observations) {
    auto checked = check_keys(observations, "Observation");
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    std::map<std::string, protocol::Action> actions;
    for (const auto& entry : observations) {
        actions.emplace(entry.first, agents_.at(entry.first)->act(entry.second));
    }
    return actions;
}

core::errors::Status AgentPool::update(const std::map<std::string, double>& rewards) {
    auto checked = check_keys(rewards, "Reward");
    if (core::errors::is_error(checked)) {
        return checked;
    }

    for (const auto& entry : rewards) {
        agents_.at(entry.first)->update(entry.second);
    }
    return core::errors::ok();
}

core::errors::Result<Agent*> AgentPool::get_agent(const std::string& id) const {
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        return GymError{ErrorCategory::Lookup, "Unknown agent id: '" + id + "'",
                        "not_found"};
    }
    return it->second.get();
}

std::vector<std::string> AgentPool::agent_ids() const {
    std::vector<std::string> ids;
    ids.reserve(agents_.size());
    for (const auto& entry : agents_) {
        ids.push_back(entry.first);
    }
    return ids;
}

}  // namespace compgym::runtime
