#include "session/in_memory_episode.hpp"

#include <iterator>
#include <utility>

namespace compgym::session {

core::errors::Result<protocol::Step> InMemoryEpisode::get(const std::size_t index) const {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }
    return steps_[index];
}

core::errors::Status InMemoryEpisode::set(const std::size_t index,
                                          const protocol::Step& step) {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }
    steps_[index] = step;
    return core::errors::ok();
}

core::errors::Status InMemoryEpisode::push(const protocol::Step& step) {
    steps_.push_back(step);
    return core::errors::ok();
}

core::errors::Status InMemoryEpisode::insert(const protocol::Step& step,
                                             const std::size_t index) {
    if (index > steps_.size()) {
        return index_error(index, steps_.size());
    }
    steps_.insert(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)), step);
    return core::errors::ok();
}

core::errors::Result<protocol::Step> InMemoryEpisode::pop() {
    if (steps_.empty()) {
        return index_error(0, 0);
    }
    protocol::Step last = std::move(steps_.back());
    steps_.pop_back();
    return last;
}

core::errors::Status InMemoryEpisode::remove(const std::size_t index) {
    if (index >= steps_.size()) {
        return index_error(index, steps_.size());
    }
    steps_.erase(std::next(steps_.begin(), static_cast<std::ptrdiff_t>(index)));
    return core::errors::ok();
}

core::errors::Status InMemoryEpisode::clear() {
    steps_.clear();
    return core::errors::ok();
}

}  // namespace compgym::session
