#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/config/id_counter.hpp"
#include "core/errors/gym_errors.hpp"
#include "runtime/agent.hpp"

namespace compgym::runtime {

// Keyed collection of agents driven in lockstep. The key sets of
// observations, rewards and agents must match exactly at every call;
// a mismatch is reported before any agent is invoked.
class AgentPool {
public:
    using AgentFactory = std::function<std::unique_ptr<Agent>()>;

    // Fresh ids continue after the largest numeric id in `initial_ids`.
    AgentPool(AgentFactory factory, const std::vector<std::string>& initial_ids);

    // Creates one agent under the next free id and returns that id.
    std::string add_agent();

    void reset();

    core::errors::Result<std::map<std::string, protocol::Action>> act(
        const std::map<std::string, protocol::Observation>& observations);
    core::errors::Status update(const std::map<std::string, double>& rewards);

    core::errors::Result<Agent*> get_agent(const std::string& id) const;

    std::vector<std::string> agent_ids() const;
    std::size_t size() const { return agents_.size(); }

private:
    template <typename T>
    core::errors::Status check_keys(const std::map<std::string, T>& keyed,
                                    const std::string& what) const;

    AgentFactory factory_;
    std::map<std::string, std::unique_ptr<Agent>> agents_;
    core::config::IdCounter next_id_;
};

}  // namespace compgym::runtime
