#pragma once

/** \file distance.hpp
 *  \brief Scalar similarity kernels over unit vectors (inner product, norms).
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 */

#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace facet::kernels {

/** \brief Inner product: sum(a[i] * b[i]). O(d). Equals cosine for unit vectors. */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }
  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Euclidean norm ||a||. */
inline float l2_norm(std::span<const float> a) noexcept {
  return std::sqrt(inner_product(a, a));
}

/** \brief Scale \p a to unit length in place.
 *  \return false when the norm is zero or not finite (vector left untouched).
 */
inline bool normalize(std::span<float> a) noexcept {
  const float n = l2_norm(a);
  if (!(n > 0.0f) || !std::isfinite(n)) return false;
  const float inv = 1.0f / n;
  for (auto& x : a) x *= inv;
  return true;
}

/** \brief Normalized average of two vectors, (a + b) / ||a + b||.
 *  Returns the plain sum when it has zero norm.
 */
inline std::vector<float> normalized_mean(std::span<const float> a, std::span<const float> b) {
  std::vector<float> out(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) out[i] = 0.5f * (a[i] + b[i]);
  (void)normalize(out);
  return out;
}

/** \brief out += w * a. */
inline void axpy(float w, std::span<const float> a, std::span<float> out) noexcept {
  for (std::size_t i = 0; i < a.size(); ++i) out[i] += w * a[i];
}

} // namespace facet::kernels
