#include "promptvec/maintenance/performance_tracker.hpp"

#include <numeric>

namespace promptvec::maintenance {

auto PerformanceTracker::record(std::string_view operation, double millis) -> void {
    if (window_ == 0) return;
    std::lock_guard lock(mutex_);
    auto it = samples_.find(operation);
    if (it == samples_.end()) {
        it = samples_.emplace(std::string(operation), std::deque<double>{}).first;
    }
    it->second.push_back(millis);
    while (it->second.size() > window_) it->second.pop_front();
}

auto PerformanceTracker::average(std::string_view operation) const -> double {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(operation);
    if (it == samples_.end() || it->second.empty()) return 0.0;
    return std::accumulate(it->second.begin(), it->second.end(), 0.0) /
           static_cast<double>(it->second.size());
}

auto PerformanceTracker::samples(std::string_view operation) const -> std::size_t {
    std::lock_guard lock(mutex_);
    auto it = samples_.find(operation);
    return it == samples_.end() ? 0 : it->second.size();
}

auto PerformanceTracker::clear() -> void {
    std::lock_guard lock(mutex_);
    samples_.clear();
}

} // namespace promptvec::maintenance
