#pragma once

/** \file kmeans.hpp
 *  \brief Spherical k-means (cosine distance) over unit-length document vectors.
 *
 * Lloyd iterations with distance 1 - cosine_similarity:
 * - Initial centroids are k distinct input vectors drawn with a seeded generator
 * - Iteration stops when no assignment changes or after max_iter rounds
 * - Empty clusters keep their previous centroid
 *
 * Thread-safety: assignment is internally parallelized (OpenMP when available);
 * the call itself is not reentrant on shared outputs.
 * Determinism: fixed seed produces reproducible results.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "promptvec/error.hpp"

namespace promptvec::index {

/** \brief K-means clustering parameters. */
struct KmeansParams {
    std::uint32_t k{10};                 /**< Number of clusters */
    std::uint32_t max_iter{100};         /**< Maximum iterations */
    std::uint32_t seed{42};              /**< Random seed */
};

/** \brief K-means clustering result. */
struct KmeansResult {
    std::vector<std::vector<float>> centroids;  /**< Cluster centers [k x dim] */
    std::vector<std::uint32_t> assignments;     /**< Point assignments [n] */
    std::vector<std::uint32_t> cluster_sizes;   /**< Points per cluster [k] */
    std::uint32_t iterations{0};                /**< Iterations performed */
    bool converged{false};                      /**< Assignments stabilized before max_iter */
};

/** \brief Cluster n row-major vectors of dimension dim.
 *
 * Errors: invalid_argument when k == 0 or k > n
 * Complexity: O(n * k * dim * iterations)
 */
auto kmeans_cluster(const float* data, std::size_t n, std::size_t dim,
                    const KmeansParams& params)
    -> std::expected<KmeansResult, core::error>;

/** \brief Assign points to the centroid with the smallest cosine distance.
 *
 * \return number of points whose assignment changed
 * Thread-safety: Internally parallelized
 */
auto kmeans_assign(const float* data, std::size_t n, std::size_t dim,
                   const std::vector<std::vector<float>>& centroids,
                   std::span<std::uint32_t> assignments) -> std::size_t;

/** \brief Recompute centroids as member means; empty clusters are left as is. */
auto kmeans_update_centroids(const float* data, std::size_t n, std::size_t dim,
                             std::span<const std::uint32_t> assignments,
                             std::uint32_t k,
                             std::vector<std::vector<float>>& centroids) -> void;

/** \brief Mean cosine silhouette coefficient in [-1, 1].
 *
 * Points in singleton clusters score 0. With more than max_points points an evenly
 * strided sample is scored. Returns 0 for fewer than two clusters.
 * Complexity: O(min(n, max_points) * n * dim)
 */
auto silhouette_score(const float* data, std::size_t n, std::size_t dim,
                      std::span<const std::uint32_t> assignments, std::uint32_t k,
                      std::size_t max_points = 2000) -> float;

} // namespace promptvec::index
