/** \file event_channel.cpp
 *  \brief Bounded single-worker analytics queue.
 */

#include "promptvec/analytics/event_channel.hpp"
#include "promptvec/core/debug.hpp"

#include <exception>
#include <utility>

namespace promptvec::analytics {

EventChannel::EventChannel(std::shared_ptr<AnalyticsSink> sink, std::size_t capacity)
    : sink_(sink ? std::move(sink) : std::make_shared<NullAnalyticsSink>())
    , capacity_(capacity) {
    worker_ = std::thread(&EventChannel::worker_loop, this);
}

EventChannel::~EventChannel() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    not_empty_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto EventChannel::post(AnalyticsEvent event) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ || queue_.size() >= capacity_) {
            const auto n = dropped_.fetch_add(1) + 1;
            // Rate-limit the warning to powers of two.
            if ((n & (n - 1)) == 0) {
                core::log_warning("analytics", "queue full, dropped " + std::to_string(n) + " event(s)");
            }
            return false;
        }
        queue_.push_back(std::move(event));
        enqueued_.fetch_add(1);
    }
    not_empty_.notify_one();
    return true;
}

auto EventChannel::flush() -> void {
    std::unique_lock lock(mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

auto EventChannel::stats() const -> ChannelStats {
    return ChannelStats{enqueued_.load(), delivered_.load(), failed_.load(), dropped_.load()};
}

auto EventChannel::worker_loop() -> void {
    std::unique_lock lock(mutex_);
    for (;;) {
        not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ with nothing left to deliver
            break;
        }
        AnalyticsEvent event = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        deliver(event);

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            drained_.notify_all();
        }
    }
    drained_.notify_all();
}

auto EventChannel::deliver(const AnalyticsEvent& event) -> void {
    try {
        if (auto r = sink_->record(event); !r) {
            failed_.fetch_add(1);
            core::log_warning("analytics", "failed to record " + event.event_type + ": " + r.error().message);
            return;
        }
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        core::log_warning("analytics", "sink threw while recording " + event.event_type + ": " + e.what());
        return;
    }
    delivered_.fetch_add(1);
}

} // namespace promptvec::analytics
