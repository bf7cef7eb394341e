#pragma once

/** \file distance.hpp
 *  \brief Scalar distance and similarity kernels (L2^2, dot product, cosine).
 *
 * Preconditions
 * - a.size() == b.size(); callers validate dimensions before calling
 * - All inputs are finite
 * Cosine similarity is defined as 0 when either norm is zero.
 * Determinism: pure functions, no allocations, no exceptions.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace kestrel::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i + 1] - pb[i + 1];
    const float d2 = pa[i + 2] - pb[i + 2];
    const float d3 = pa[i + 3] - pb[i + 3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }
  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i + 1] * pb[i + 1];
    s2 += pa[i + 2] * pb[i + 2];
    s3 += pa[i + 3] * pb[i + 3];
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

/** \brief Cosine from a precomputed dot product and norms; 0 when a norm is 0. */
inline float cosine_from_parts(float dot, float norm_a, float norm_b) noexcept {
  if (norm_a == 0.0f || norm_b == 0.0f) return 0.0f;
  return dot / (norm_a * norm_b);
}

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||). O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot = 0.0f, na = 0.0f, nb = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    const float av = pa[i], bv = pb[i];
    dot += av * bv;
    na += av * av;
    nb += bv * bv;
  }
  return cosine_from_parts(dot, std::sqrt(na), std::sqrt(nb));
}

} // namespace kestrel::kernels
