#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include "core/errors/gym_errors.hpp"
#include "protocol/step_contract.hpp"

namespace compgym::session {

class Episode;

// Lazy forward iterator over an episode. Each dereference fetches the step
// at the current index, so durable episodes read one record at a time.
class StepIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = core::errors::Result<protocol::Step>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = value_type;

    StepIterator(const Episode* episode, std::size_t index)
        : episode_(episode), index_(index) {}

    value_type operator*() const;
    StepIterator& operator++() {
        ++index_;
        return *this;
    }

    bool operator==(const StepIterator& other) const { return index_ == other.index_; }
    bool operator!=(const StepIterator& other) const { return index_ != other.index_; }

private:
    const Episode* episode_;
    std::size_t index_;
};

// Finite and restartable: every begin() starts over at step 0.
class StepRange {
public:
    explicit StepRange(const Episode& episode) : episode_(&episode) {}

    StepIterator begin() const;
    StepIterator end() const;

private:
    const Episode* episode_;
};

// Ordered sequence of steps. Indices are 0-based; out-of-range access is an
// index_out_of_range error. Ordering is exactly the call order of push and
// insert.
class Episode {
public:
    virtual ~Episode() = default;

    virtual std::size_t num_steps() const = 0;
    virtual core::errors::Result<protocol::Step> get(std::size_t index) const = 0;
    virtual core::errors::Status set(std::size_t index, const protocol::Step& step) = 0;

    virtual core::errors::Status push(const protocol::Step& step) = 0;
    // Valid positions are 0..num_steps().
    virtual core::errors::Status insert(const protocol::Step& step, std::size_t index) = 0;
    virtual core::errors::Result<protocol::Step> pop() = 0;
    virtual core::errors::Status remove(std::size_t index) = 0;
    virtual core::errors::Status clear() = 0;

    StepRange iter_steps() const { return StepRange(*this); }

    core::errors::Result<double> total_reward() const;

    // Writes {"steps": [...]} as one JSON document.
    core::errors::Status save(const std::filesystem::path& path) const;

protected:
    static core::errors::GymError index_error(std::size_t index, std::size_t size);
};

}  // namespace compgym::session
