#pragma once

/** \file event_channel.hpp
 *  \brief Fire-and-forget analytics delivery.
 *
 * Producers post events into a bounded queue; a single worker thread hands them to
 * the sink. A full queue drops the new event. Sink failures are logged and counted
 * and never reach the operation that produced the event.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "promptvec/document.hpp"
#include "promptvec/error.hpp"

namespace promptvec::analytics {

/** \brief One analytics record. */
struct AnalyticsEvent {
    std::string event_type;                  /**< e.g. "vector_search" */
    std::string entity_id;
    std::string entity_type;
    std::map<std::string, std::string> data;
    Timestamp timestamp{};
};

/** \brief Consumed analytics interface. */
class AnalyticsSink {
public:
    virtual ~AnalyticsSink() = default;
    virtual auto record(const AnalyticsEvent& event) -> std::expected<void, core::error> = 0;
};

/** \brief Sink that discards everything. */
class NullAnalyticsSink final : public AnalyticsSink {
public:
    auto record(const AnalyticsEvent&) -> std::expected<void, core::error> override { return {}; }
};

/** \brief Delivery counters. */
struct ChannelStats {
    std::uint64_t enqueued{0};
    std::uint64_t delivered{0};
    std::uint64_t failed{0};
    std::uint64_t dropped{0};
};

class EventChannel {
public:
    EventChannel(std::shared_ptr<AnalyticsSink> sink, std::size_t capacity);
    ~EventChannel();

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /** \brief Queue an event. \return false when the queue is full and the event was dropped */
    auto post(AnalyticsEvent event) -> bool;

    /** \brief Block until every queued event has been handed to the sink. */
    auto flush() -> void;

    [[nodiscard]] auto stats() const -> ChannelStats;

private:
    auto worker_loop() -> void;
    auto deliver(const AnalyticsEvent& event) -> void;

    std::shared_ptr<AnalyticsSink> sink_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable drained_;
    std::deque<AnalyticsEvent> queue_;
    bool stopping_{false};
    bool busy_{false};

    std::atomic<std::uint64_t> enqueued_{0};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> dropped_{0};

    std::thread worker_;
};

} // namespace promptvec::analytics
