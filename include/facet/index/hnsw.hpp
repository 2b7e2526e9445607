#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) graph over unit vectors.
 *
 * Used for pools above the flat-index threshold. No training phase: the
 * graph is grown by insertion with fixed construction parameters.
 * Features:
 * - Multi-layer proximity graph with hierarchical structure
 * - Greedy descent on upper layers, beam search (efSearch) on the base layer
 * - Inner-product similarity (vectors are unit-normalized by the pool)
 *
 * Thread-safety: Build is single-threaded; once built the graph is read-only
 * and search is safe for concurrent calls.
 * Memory: O(M * N) edges where M is max connections per node.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <utility>
#include <vector>

#include "facet/error.hpp"

namespace facet::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{32};                    /**< Max connections per node on upper layers */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool extend_candidates{true};           /**< Refill pruned slots from discarded candidates */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t efSearch{100};            /**< Beam width during search */
    std::uint32_t k{10};                    /**< Number of neighbors to return */
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_nodes{0};
    std::size_t n_edges{0};
    std::size_t n_levels{0};
    float avg_degree{0.0f};
};

class HnswIndex {
public:
    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize index with parameters.
     *
     * Preconditions: dim > 0; M >= 2; efConstruction >= M
     */
    auto init(std::size_t dim, const HnswBuildParams& params, std::size_t max_elements = 0)
        -> std::expected<void, core::error>;

    /** \brief Insert the next vector; its label is its insertion position.
     *
     * Complexity: O(M * log(N) * efConstruction)
     * Thread-safety: NOT thread-safe
     */
    auto add(std::span<const float> vec) -> std::expected<std::uint32_t, core::error>;

    /** \brief Approximate top-k by inner product.
     *
     * \return (position, similarity) pairs, similarity descending, ties by position.
     * Thread-safety: Safe for concurrent calls once building is complete.
     */
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error>;

    auto get_stats() const noexcept -> HnswStats;
    auto dimension() const noexcept -> std::size_t;
    auto size() const noexcept -> std::size_t;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Select up to M neighbors from distance-sorted candidates (HNSW Algorithm 4 heuristic).
 *
 * \param candidates (distance, node) pairs; sorted in place
 * \return (selected, discarded)
 */
auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M, bool extend_candidates)
    -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>>;

} // namespace facet::index
