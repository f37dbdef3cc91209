#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include "protocol/observation_contract.hpp"

namespace compgym::runtime {

// Single-slot channel holding the latest observation. The step loop
// publishes; pollers copy out. Every publish bumps the version.
class ObservationSlot {
public:
    void publish(protocol::Observation observation) {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(observation);
        ++version_;
    }

    // Latest observation and its version, or nullopt before the first publish.
    std::optional<std::pair<std::uint64_t, protocol::Observation>> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!latest_.has_value()) {
            return std::nullopt;
        }
        return std::make_pair(version_, latest_.value());
    }

    std::uint64_t version() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return version_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<protocol::Observation> latest_;
    std::uint64_t version_ = 0;
};

}  // namespace compgym::runtime
