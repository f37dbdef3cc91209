#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include "protocol/observation_contract.hpp"
#include "runtime/observation_slot.hpp"

namespace compgym::runtime {

// Background reader of an ObservationSlot. Every interval it checks the slot
// and hands each new observation version to the sink. The poller only reads
// the slot; it never touches the step loop's state.
class PreviewPoller {
public:
    using Sink = std::function<void(std::uint64_t version, const protocol::Observation&)>;

    PreviewPoller(const ObservationSlot& slot, std::chrono::milliseconds interval, Sink sink);
    ~PreviewPoller();

    PreviewPoller(const PreviewPoller&) = delete;
    PreviewPoller& operator=(const PreviewPoller&) = delete;

    // Starting a running poller is a no-op.
    void start();
    // Idempotent. Joins the worker thread.
    void stop();

    bool running() const { return worker_.joinable(); }
    std::uint64_t delivered() const { return delivered_.load(); }

private:
    void run(std::shared_ptr<std::atomic_bool> stop_token);

    const ObservationSlot& slot_;
    std::chrono::milliseconds interval_;
    Sink sink_;
    std::shared_ptr<std::atomic_bool> stop_token_;
    std::thread worker_;
    std::atomic<std::uint64_t> delivered_{0};
};

}  // namespace compgym::runtime
