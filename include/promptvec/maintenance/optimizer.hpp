#pragma once

/** \file optimizer.hpp
 *  \brief Maintenance pass over the document store and database statistics.
 *
 * optimize() runs its sub-steps independently: a failing step is reported and the
 * remaining steps still run. Order: garbage collection (compaction and adjacency
 * cleanup), hierarchical index rebuild, quantizer recalibration, cache clears,
 * and a rebalance step above the size threshold (currently a logged no-op).
 */

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "promptvec/config.hpp"
#include "promptvec/error.hpp"
#include "promptvec/store/document_store.hpp"

namespace promptvec::maintenance {

struct MemoryUsage {
    double vectors_mb{0.0};
    double quantized_mb{0.0};
    double metadata_mb{0.0};
    double index_mb{0.0};
    double total_mb{0.0};
};

struct PerformanceMetrics {
    double avg_search_time_ms{0.0};
    double avg_insert_time_ms{0.0};
    double cache_hit_rate{0.0};
    double queries_per_second{0.0};
};

struct ClusterInfo {
    std::size_t num_clusters{0};
    double avg_cluster_size{0.0};
    double silhouette_score{0.0};
};

struct IndexStatistics {
    std::size_t total_documents{0};
    std::size_t total_vectors{0};
    std::size_t dimensions{0};
    MemoryUsage memory_usage;
    PerformanceMetrics performance_metrics;
    std::optional<ClusterInfo> cluster_info;
};

/** \brief Memory estimate: vectors N*D*4, codes N*D, metadata estimate, 4 bytes per adjacency entry. */
auto memory_usage(const store::DocumentStore& store) -> MemoryUsage;

/** \brief Outcome of one optimize() sub-step. */
struct StepOutcome {
    std::string name;                    /**< "garbage_collection", "rebuild_index", ... */
    bool applied{false};                 /**< Ran and changed or refreshed state */
    std::string detail;                  /**< Human-readable summary */
    std::optional<core::error> error;    /**< Set when the step failed */
};

struct OptimizationReport {
    IndexStatistics before_stats;
    IndexStatistics after_stats;
    std::vector<StepOutcome> steps;
    /** \brief (before - after) / before * 100 over average search time; 0 without a baseline. */
    double performance_improvement{0.0};

    [[nodiscard]] auto optimizations_applied() const -> std::vector<std::string>;
    [[nodiscard]] auto all_succeeded() const noexcept -> bool;
};

/** \brief Percentage latency change; 0 when before_ms is not positive. */
auto improvement_percent(double before_ms, double after_ms) noexcept -> double;

class Optimizer {
public:
    /** \brief Drops search and cluster results; a failure is recorded on the clear_caches step. */
    using CacheClear = std::function<std::expected<void, core::error>()>;

    explicit Optimizer(const DatabaseConfig& cfg) : rebalance_threshold_(cfg.rebalance_threshold) {}

    /** \brief Run every maintenance step. */
    auto run(store::DocumentStore& store, const CacheClear& clear_caches) const
        -> std::vector<StepOutcome>;

private:
    std::size_t rebalance_threshold_;
};

} // namespace promptvec::maintenance
