#pragma once

/** \file cluster_analyzer.hpp
 *  \brief Document clustering with per-cluster statistics and a result cache.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "promptvec/cache/lru_cache.hpp"
#include "promptvec/config.hpp"
#include "promptvec/error.hpp"
#include "promptvec/store/document_store.hpp"

namespace promptvec::analysis {

/** \brief Clustering strategy. Only KMeans is implemented. */
enum class ClusterAlgorithm : std::uint8_t {
    KMeans,
    Hierarchical,
    DBSCAN,
};

auto to_string(ClusterAlgorithm algorithm) noexcept -> std::string_view;

struct EffectivenessStats {
    double mean{0.0};
    double median{0.0};
    double stddev{0.0};        /**< Population standard deviation */
};

struct ClusterMember {
    std::string id;
    float distance_to_centroid{0.0f};
};

struct ClusterResult {
    std::string id;                             /**< "cluster_<i>" */
    std::string name;                           /**< "Cluster <i+1>" */
    std::vector<float> centroid;
    std::vector<ClusterMember> members;         /**< Insertion order */
    std::size_t size{0};
    float avg_similarity{0.0f};                 /**< Mean pairwise cosine within the cluster */
    std::vector<std::string> dominant_tags;     /**< Up to 5, by count then name */
    EffectivenessStats effectiveness;
};

/** \brief Clusters plus a quality score over the same assignment. */
struct Clustering {
    std::vector<ClusterResult> clusters;
    float silhouette{0.0f};
    std::uint32_t iterations{0};
};

class ClusterAnalyzer {
public:
    explicit ClusterAnalyzer(const DatabaseConfig& cfg);

    /** \brief Cluster the live corpus, serving repeated (k, algorithm) requests from cache.
     *
     * Errors: invalid_argument (k == 0, k > corpus size), unsupported (Hierarchical, DBSCAN)
     * Complexity: O(n * k * dim * iterations) plus O(sum of cluster_size^2 * dim) for stats
     */
    auto cluster(const store::DocumentStore& store, std::uint32_t k, ClusterAlgorithm algorithm)
        -> std::expected<Clustering, core::error>;

    auto invalidate() -> void { cache_.clear(); }
    [[nodiscard]] auto cache_stats() const -> cache::CacheStats { return cache_.stats(); }

private:
    auto run_kmeans(const store::DocumentStore& store, std::uint32_t k) const
        -> std::expected<Clustering, core::error>;

    std::uint32_t max_iter_;
    std::uint32_t seed_;
    cache::LruCache<std::string, Clustering> cache_;
};

/** \brief Mean, upper median and population standard deviation of present values. */
auto effectiveness_stats(std::vector<double> values) -> EffectivenessStats;

/** \brief The n most frequent tags, ties broken by name. */
auto top_tags(const std::vector<const VectorDocument*>& docs, std::size_t n) -> std::vector<std::string>;

} // namespace promptvec::analysis
