#pragma once

/** \file performance_tracker.hpp
 *  \brief Sliding-window latency samples per operation.
 */

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace promptvec::maintenance {

class PerformanceTracker {
public:
    explicit PerformanceTracker(std::size_t window) : window_(window) {}

    /** \brief Add a sample, evicting the oldest once the window is full. */
    auto record(std::string_view operation, double millis) -> void;

    /** \brief Mean of the retained samples; 0 when there are none. */
    [[nodiscard]] auto average(std::string_view operation) const -> double;
    [[nodiscard]] auto samples(std::string_view operation) const -> std::size_t;

    auto clear() -> void;

private:
    std::size_t window_;
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<double>, std::less<>> samples_;
};

} // namespace promptvec::maintenance
