#pragma once

/** \file config.hpp
 *  \brief Engine configuration with defaults, validation and environment overrides.
 */

#include <chrono>
#include <cstdint>
#include <expected>

#include "promptvec/error.hpp"

namespace promptvec {

/** \brief Hierarchical index build/search parameters. */
struct HierarchicalIndexParams {
    std::uint32_t M{10};                    /**< Neighbors recorded per node per level */
    std::uint32_t max_level{16};            /**< Level cap for geometric assignment */
    float level_probability{0.5f};          /**< Chance of promotion to each next level */
    std::uint32_t ef_search{64};            /**< Beam width at level 0 (raised to limit when smaller) */
    std::uint32_t seed{42};                 /**< Level assignment seed */
};

/** \brief Full engine configuration. */
struct DatabaseConfig {
    std::size_t dimension{384};
    HierarchicalIndexParams index;

    // Search
    std::uint32_t default_limit{20};
    float default_threshold{0.5f};
    std::size_t search_cache_capacity{1000};
    std::chrono::seconds search_cache_ttl{std::chrono::minutes(15)};
    std::size_t cache_key_prefix{10};       /**< Query components folded into the cache key */

    // Clustering
    std::size_t cluster_cache_capacity{100};
    std::chrono::seconds cluster_cache_ttl{std::chrono::hours(1)};
    std::uint32_t kmeans_max_iter{100};
    std::uint32_t cluster_seed{42};

    // Recommendations
    float recommendation_threshold{0.3f};
    std::chrono::hours recent_interaction_window{24 * 7};
    double recency_decay_days{30.0};

    // Drift
    std::chrono::hours drift_recent_window{24 * 30};
    std::chrono::hours drift_older_window{24 * 90};
    double trending_growth_min{0.5};
    double overall_drift_alert{0.3};
    double domain_drift_alert{0.4};

    // Batching and maintenance
    std::size_t batch_chunk_size{100};
    std::chrono::milliseconds batch_pause{10};
    std::size_t recalibration_batch_threshold{100};
    std::size_t rebalance_threshold{1000};
    std::uint32_t list_default_limit{100};

    // Observability
    std::size_t analytics_queue_capacity{1024};
    std::size_t perf_window{100};

    /** \brief Reject impossible settings. */
    auto validate() const -> std::expected<void, core::error>;
};

/** \brief Overlay PROMPTVEC_* environment variables onto cfg; unparsable values are ignored. */
auto apply_env_overrides(DatabaseConfig& cfg) noexcept -> void;

} // namespace promptvec
