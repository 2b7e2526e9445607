#pragma once

/** \file flat_index.hpp
 *  \brief Exact inner-product top-k over an embedding matrix.
 *
 * Ordering: score descending, ties broken by ascending row position, so the
 * result is stable with respect to pool order.
 */

#include <cstdint>
#include <span>
#include <vector>

#include <roaring/roaring.hh>

#include "facet/index/embedding_matrix.hpp"

namespace facet::index {

/** \brief One scored row. */
struct ScoredRow {
    std::uint32_t position{};
    float score{};
};

/** \brief Strict "ranks before" order: higher score, then lower position. */
inline bool ranks_before(const ScoredRow& a, const ScoredRow& b) noexcept {
    if (a.score != b.score) return a.score > b.score;
    return a.position < b.position;
}

/** \brief Exact top-k by inner product.
 *
 * \param restrict_to Optional eligible row set; nullptr searches all rows.
 * \return at most min(k, eligible) rows ordered by ranks_before.
 * Preconditions: query.size() == m.dim
 * Complexity: O(eligible * dim + eligible * log k)
 */
auto flat_search(const EmbeddingMatrix& m, std::span<const float> query, std::size_t k,
                 const roaring::Roaring* restrict_to = nullptr) -> std::vector<ScoredRow>;

} // namespace facet::index
