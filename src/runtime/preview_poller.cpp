#include "runtime/preview_poller.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace compgym::runtime {

namespace {

constexpr auto kMinInterval = std::chrono::milliseconds(1);

}  // namespace

PreviewPoller::PreviewPoller(const ObservationSlot& slot,
                             const std::chrono::milliseconds interval, Sink sink)
    : slot_(slot), interval_(std::max(interval, kMinInterval)), sink_(std::move(sink)) {}

PreviewPoller::~PreviewPoller() {
    stop();
}

void PreviewPoller::start() {
    if (worker_.joinable()) {
        return;
    }
    stop_token_ = std::make_shared<std::atomic_bool>(false);
    worker_ = std::thread(&PreviewPoller::run, this, stop_token_);
    LOG_DEBUG("PreviewPoller: started, interval " + std::to_string(interval_.count()) + "ms");
}

void PreviewPoller::stop() {
    if (!worker_.joinable()) {
        return;
    }
    stop_token_->store(true);
    worker_.join();
    LOG_DEBUG("PreviewPoller: stopped after " + std::to_string(delivered_.load()) +
              " previews");
}

void PreviewPoller::run(std::shared_ptr<std::atomic_bool> stop_token) {
    std::uint64_t last_version = 0;
    while (!stop_token->load()) {
        const auto latest = slot_.latest();
        if (latest.has_value() && latest->first != last_version) {
            last_version = latest->first;
            if (sink_) {
                sink_(latest->first, latest->second);
            }
            delivered_.fetch_add(1);
        }
        std::this_thread::sleep_for(interval_);
    }
}

}  // namespace compgym::runtime
