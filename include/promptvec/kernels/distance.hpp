#pragma once

/** \file distance.hpp
 *  \brief Scalar reference kernels for cosine math over dense float vectors.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Zero vectors are legal: cosine_similarity returns 0 when either norm is 0, and
 * normalize_in_place leaves an all-zero vector untouched.
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace promptvec::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Euclidean norm ||a||. O(d). */
inline float l2_norm(std::span<const float> a) noexcept {
  return std::sqrt(inner_product(a, a));
}

/** \brief Cosine similarity in [-1, 1]; 0 when either vector has zero norm. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size() < b.size() ? a.size() : b.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot0 = 0.0f, dot1 = 0.0f;
  float na0 = 0.0f, na1 = 0.0f;
  float nb0 = 0.0f, nb1 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(1);
  for (; i < unroll_end; i += 2) {
    const float a0 = pa[i], b0 = pb[i];
    const float a1 = pa[i+1], b1 = pb[i+1];
    dot0 += a0 * b0; na0 += a0 * a0; nb0 += b0 * b0;
    dot1 += a1 * b1; na1 += a1 * a1; nb1 += b1 * b1;
  }

  float dot = dot0 + dot1;
  float na = na0 + na1;
  float nb = nb0 + nb1;
  for (; i < n; ++i) {
    const float av = pa[i], bv = pb[i];
    dot += av * bv;
    na += av * av;
    nb += bv * bv;
  }

  if (na == 0.0f || nb == 0.0f) return 0.0f;
  const float sim = dot / (std::sqrt(na) * std::sqrt(nb));
  // Rounding can push identical directions a hair past 1.
  return sim > 1.0f ? 1.0f : (sim < -1.0f ? -1.0f : sim);
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b). O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return 1.0f - cosine_similarity(a, b);
}

/** \brief Scale to unit length in place. All-zero input is left unchanged. */
inline void normalize_in_place(std::span<float> v) noexcept {
  const float norm = l2_norm(v);
  if (norm == 0.0f) return;
  for (auto& x : v) x /= norm;
}

/** \brief Copying variant of normalize_in_place. */
inline auto normalized(std::vector<float> v) -> std::vector<float> {
  normalize_in_place(v);
  return v;
}

/** \brief Arithmetic mean of equally sized vectors; zero vector of length dim when empty. */
inline auto centroid(const std::vector<std::span<const float>>& vectors, std::size_t dim)
    -> std::vector<float> {
  std::vector<double> acc(dim, 0.0);
  for (const auto& v : vectors) {
    for (std::size_t d = 0; d < dim && d < v.size(); ++d) acc[d] += v[d];
  }
  std::vector<float> out(dim, 0.0f);
  if (vectors.empty()) return out;
  const double inv = 1.0 / static_cast<double>(vectors.size());
  for (std::size_t d = 0; d < dim; ++d) out[d] = static_cast<float>(acc[d] * inv);
  return out;
}

} // namespace promptvec::kernels
