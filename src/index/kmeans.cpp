#include "promptvec/index/kmeans.hpp"
#include "promptvec/core/debug.hpp"
#include "promptvec/kernels/distance.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <numeric>
#include <random>

namespace promptvec::index {

namespace {

inline auto row(const float* data, std::size_t i, std::size_t dim) -> std::span<const float> {
    return std::span<const float>(data + i * dim, dim);
}

/** \brief Find nearest centroid for a point (ties go to the lowest index). */
auto find_nearest_centroid(std::span<const float> point,
                           const std::vector<std::vector<float>>& centroids) -> std::uint32_t {
    std::uint32_t best_idx = 0;
    float best_dist = std::numeric_limits<float>::max();

    for (std::uint32_t i = 0; i < centroids.size(); ++i) {
        const float dist = kernels::cosine_distance(point, centroids[i]);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = i;
        }
    }
    return best_idx;
}

} // anonymous namespace

auto kmeans_assign(const float* data, std::size_t n, std::size_t dim,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> std::size_t {
    std::size_t changed = 0;

    #pragma omp parallel for reduction(+:changed)
    for (int i = 0; i < static_cast<int>(n); ++i) {
        const auto idx = find_nearest_centroid(row(data, static_cast<std::size_t>(i), dim), centroids);
        if (assignments[i] != idx) {
            assignments[i] = idx;
            ++changed;
        }
    }
    return changed;
}

auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void {
    std::vector<std::vector<double>> sums(k, std::vector<double>(dim, 0.0));
    std::vector<std::uint32_t> counts(k, 0);

    for (std::size_t i = 0; i < n; ++i) {
        const std::uint32_t cluster = assignments[i];
        counts[cluster]++;
        const float* point = data + i * dim;
        for (std::size_t d = 0; d < dim; ++d) {
            sums[cluster][d] += point[d];
        }
    }

    for (std::uint32_t c = 0; c < k; ++c) {
        if (counts[c] > 0) {
            for (std::size_t d = 0; d < dim; ++d) {
                centroids[c][d] = static_cast<float>(sums[c][d] / counts[c]);
            }
        }
        // If cluster is empty, keep previous centroid
    }
}

auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error> {
    using core::error;
    using core::error_code;

    if (params.k == 0) {
        return std::unexpected(error{error_code::invalid_argument,
                                     "k must be > 0", "kmeans"});
    }
    if (params.k > n) {
        return std::unexpected(error{error_code::invalid_argument,
                                     "cannot create more clusters than documents", "kmeans"});
    }

    const auto start = std::chrono::steady_clock::now();

    // k distinct rows as initial centroids
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::mt19937 gen(params.seed);
    std::shuffle(order.begin(), order.end(), gen);

    KmeansResult result;
    result.centroids.reserve(params.k);
    for (std::uint32_t c = 0; c < params.k; ++c) {
        const auto r = row(data, order[c], dim);
        result.centroids.emplace_back(r.begin(), r.end());
    }

    // Sentinel so the first round never counts as converged.
    result.assignments.assign(n, std::numeric_limits<std::uint32_t>::max());

    while (result.iterations < params.max_iter) {
        const auto changed = kmeans_assign(data, n, dim, result.centroids, result.assignments);
        ++result.iterations;
        if (changed == 0) {
            result.converged = true;
            break;
        }
        kmeans_update_centroids(data, n, dim, result.assignments, params.k, result.centroids);
    }

    result.cluster_sizes.assign(params.k, 0);
    for (auto a : result.assignments) result.cluster_sizes[a]++;

    if (core::debug_enabled()) {
        const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        std::cerr << "[promptvec][kmeans] n=" << n << " k=" << params.k
                  << " iters=" << result.iterations << " converged=" << result.converged
                  << " time=" << secs << "s" << std::endl;
    }
    return result;
}

auto silhouette_score(const float* data, std::size_t n, std::size_t dim,
                      std::span<const std::uint32_t> assignments, std::uint32_t k,
                      std::size_t max_points) -> float {
    if (k < 2 || n < 2 || max_points == 0) return 0.0f;

    std::vector<std::uint32_t> sizes(k, 0);
    for (std::size_t i = 0; i < n; ++i) sizes[assignments[i]]++;

    const std::size_t stride = n > max_points ? (n + max_points - 1) / max_points : 1;
    const int sampled = static_cast<int>((n + stride - 1) / stride);

    double total = 0.0;
    #pragma omp parallel for reduction(+:total)
    for (int s = 0; s < sampled; ++s) {
        const std::size_t i = static_cast<std::size_t>(s) * stride;
        const std::uint32_t own = assignments[i];
        if (sizes[own] < 2) continue;

        std::vector<double> sum(k, 0.0);
        for (std::size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            sum[assignments[j]] += kernels::cosine_distance(row(data, i, dim), row(data, j, dim));
        }
        const double a = sum[own] / static_cast<double>(sizes[own] - 1);
        double b = std::numeric_limits<double>::max();
        for (std::uint32_t c = 0; c < k; ++c) {
            if (c == own || sizes[c] == 0) continue;
            b = std::min(b, sum[c] / static_cast<double>(sizes[c]));
        }
        if (b == std::numeric_limits<double>::max()) continue;
        const double denom = std::max(a, b);
        if (denom > 0.0) total += (b - a) / denom;
    }
    return static_cast<float>(total / static_cast<double>(sampled));
}

} // namespace promptvec::index
