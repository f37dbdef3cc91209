#pragma once

#include "protocol/action_contract.hpp"
#include "protocol/observation_contract.hpp"

namespace compgym::runtime {

class Agent {
public:
    virtual ~Agent() = default;

    virtual void reset() = 0;
    virtual protocol::Action act(const protocol::Observation& observation) = 0;
    virtual void update(double reward) = 0;
};

}  // namespace compgym::runtime
