/** \file cluster_analyzer.cpp
 *  \brief Cosine k-means over the document store and cluster summaries.
 */

#include "promptvec/analysis/cluster_analyzer.hpp"
#include "promptvec/core/debug.hpp"
#include "promptvec/index/kmeans.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <numeric>

namespace promptvec::analysis {

auto to_string(ClusterAlgorithm algorithm) noexcept -> std::string_view {
    switch (algorithm) {
        case ClusterAlgorithm::KMeans: return "kmeans";
        case ClusterAlgorithm::Hierarchical: return "hierarchical";
        case ClusterAlgorithm::DBSCAN: return "dbscan";
    }
    return "unknown";
}

auto effectiveness_stats(std::vector<double> values) -> EffectivenessStats {
    EffectivenessStats stats;
    if (values.empty()) return stats;

    const double n = static_cast<double>(values.size());
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    std::sort(values.begin(), values.end());
    stats.median = values[values.size() / 2];

    double sq = 0.0;
    for (double v : values) sq += (v - stats.mean) * (v - stats.mean);
    stats.stddev = std::sqrt(sq / n);
    return stats;
}

auto top_tags(const std::vector<const VectorDocument*>& docs, std::size_t n) -> std::vector<std::string> {
    std::map<std::string, std::size_t> counts;
    for (const auto* doc : docs) {
        for (const auto& tag : doc->metadata.tags) counts[tag]++;
    }
    std::vector<std::pair<std::string, std::size_t>> ranked(counts.begin(), counts.end());
    // map order is by name, so a stable sort on count keeps name order for ties
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> out;
    for (std::size_t i = 0; i < ranked.size() && i < n; ++i) out.push_back(ranked[i].first);
    return out;
}

ClusterAnalyzer::ClusterAnalyzer(const DatabaseConfig& cfg)
    : max_iter_(cfg.kmeans_max_iter)
    , seed_(cfg.cluster_seed)
    , cache_(cfg.cluster_cache_capacity, cfg.cluster_cache_ttl) {}

auto ClusterAnalyzer::cluster(const store::DocumentStore& store, std::uint32_t k,
                              ClusterAlgorithm algorithm)
    -> std::expected<Clustering, core::error> {
    if (algorithm != ClusterAlgorithm::KMeans) {
        return std::unexpected(core::error{
            core::error_code::unsupported,
            "Clustering algorithm not implemented: " + std::string(to_string(algorithm)),
            "cluster"
        });
    }

    const std::string key = "clusters_" + std::to_string(k) + "_" + std::string(to_string(algorithm));
    if (auto hit = cache_.get(key)) {
        return std::move(*hit);
    }

    auto result = run_kmeans(store, k);
    if (!result) return std::unexpected(result.error());
    cache_.put(key, *result);
    return result;
}

auto ClusterAnalyzer::run_kmeans(const store::DocumentStore& store, std::uint32_t k) const
    -> std::expected<Clustering, core::error> {
    const auto& flat = store.flat();
    const auto slots = flat.live_slots();
    const std::size_t n = slots.size();
    const std::size_t dim = flat.dimension();

    if (k == 0) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument, "k must be > 0", "cluster"});
    }
    if (k > n) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "cannot create more clusters than documents (k=" + std::to_string(k) +
                ", documents=" + std::to_string(n) + ")",
            "cluster"
        });
    }

    std::vector<float> data(n * dim);
    for (std::size_t i = 0; i < n; ++i) {
        const auto v = flat.vector(slots[i]);
        std::copy(v.begin(), v.end(), data.begin() + static_cast<std::ptrdiff_t>(i * dim));
    }

    index::KmeansParams params;
    params.k = k;
    params.max_iter = max_iter_;
    params.seed = seed_;
    auto km = index::kmeans_cluster(data.data(), n, dim, params);
    if (!km) {
        return std::unexpected(core::error{km.error().code, km.error().message, "cluster"});
    }

    Clustering out;
    out.iterations = km->iterations;
    out.clusters.resize(k);

    std::vector<std::vector<std::size_t>> members(k);
    for (std::size_t i = 0; i < n; ++i) members[km->assignments[i]].push_back(i);

    for (std::uint32_t c = 0; c < k; ++c) {
        ClusterResult& cr = out.clusters[c];
        cr.id = "cluster_" + std::to_string(c);
        cr.name = "Cluster " + std::to_string(c + 1);
        cr.centroid = km->centroids[c];
        cr.size = members[c].size();

        std::vector<const VectorDocument*> docs;
        std::vector<double> effectiveness;
        docs.reserve(members[c].size());
        for (auto i : members[c]) {
            const auto& doc = store.document(slots[i]);
            docs.push_back(&doc);
            cr.members.push_back(ClusterMember{
                doc.id, kernels::cosine_distance(flat.vector(slots[i]), cr.centroid)});
            if (doc.metadata.effectiveness) effectiveness.push_back(*doc.metadata.effectiveness);
        }

        double total = 0.0;
        std::size_t pairs = 0;
        for (std::size_t a = 0; a < members[c].size(); ++a) {
            for (std::size_t b = a + 1; b < members[c].size(); ++b) {
                total += kernels::cosine_similarity(flat.vector(slots[members[c][a]]),
                                                    flat.vector(slots[members[c][b]]));
                ++pairs;
            }
        }
        cr.avg_similarity = pairs > 0 ? static_cast<float>(total / static_cast<double>(pairs)) : 0.0f;
        cr.dominant_tags = top_tags(docs, 5);
        cr.effectiveness = effectiveness_stats(std::move(effectiveness));
    }

    out.silhouette = index::silhouette_score(data.data(), n, dim, km->assignments, k);

    if (core::debug_enabled()) {
        std::cerr << "[promptvec][cluster] k=" << k << " n=" << n
                  << " silhouette=" << out.silhouette << std::endl;
    }
    return out;
}

} // namespace promptvec::analysis
