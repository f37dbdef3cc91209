#pragma once

#include <vector>
#include "session/episode.hpp"

namespace compgym::session {

// Transient episode backed by a vector.
class InMemoryEpisode : public Episode {
public:
    InMemoryEpisode() = default;

    std::size_t num_steps() const override { return steps_.size(); }
    core::errors::Result<protocol::Step> get(std::size_t index) const override;
    core::errors::Status set(std::size_t index, const protocol::Step& step) override;

    core::errors::Status push(const protocol::Step& step) override;
    core::errors::Status insert(const protocol::Step& step, std::size_t index) override;
    core::errors::Result<protocol::Step> pop() override;
    core::errors::Status remove(std::size_t index) override;
    core::errors::Status clear() override;

private:
    std::vector<protocol::Step> steps_;
};

}  // namespace compgym::session
