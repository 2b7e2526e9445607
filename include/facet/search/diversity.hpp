#pragma once

/** \file diversity.hpp
 *  \brief Maximal Marginal Relevance re-ranking.
 *
 * Greedy selection: seed with the most relevant candidate, then repeatedly
 * take argmax(relevance - lambda * max_sim_to_selected). Similarity is the
 * inner product of the candidates' (unit) embeddings; a candidate without an
 * embedding has max_sim 0. Equal MMR values go to the earlier candidate.
 */

#include <cstddef>
#include <span>
#include <vector>

namespace facet::search {

struct MmrCandidate {
    float relevance{0.0f};
    std::span<const float> embedding{};    /**< empty when unavailable */
};

/** \brief Indices of the selected candidates in selection order.
 *
 * With at most \p k candidates every index is returned in input order.
 */
auto mmr_rerank(std::span<const MmrCandidate> candidates, std::size_t k, float lambda)
    -> std::vector<std::size_t>;

} // namespace facet::search
