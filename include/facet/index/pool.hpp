#pragma once

/** \file pool.hpp
 *  \brief Immutable per-dataset item pool with nearest-neighbor search.
 *
 * A pool owns an ordered item list and a positionally aligned embedding
 * matrix. Alignment is checked at build time: a row/item count mismatch is a
 * data_integrity error, never patched over. Rows are re-normalized to unit
 * length; a zero row is rejected.
 *
 * Index selection (Auto): exact flat search below flat_threshold items,
 * HNSW graph at or above it. Filtered searches always run exact search over
 * the eligible subset.
 *
 * Thread-safety: a built pool is read-only; all const members are safe for
 * concurrent use.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "facet/dataset.hpp"
#include "facet/error.hpp"
#include "facet/filter_criteria.hpp"
#include "facet/index/embedding_matrix.hpp"
#include "facet/index/hnsw.hpp"
#include "facet/metadata/item.hpp"

namespace facet::index {

enum class IndexType : std::uint8_t { Flat, Hnsw };

enum class SelectionStrategy : std::uint8_t {
    Auto,      /**< choose by pool size */
    Manual     /**< use PoolBuildConfig::manual_type */
};

/** \brief Pool construction configuration. */
struct PoolBuildConfig {
    SelectionStrategy strategy{SelectionStrategy::Auto};
    IndexType manual_type{IndexType::Flat};
    std::size_t flat_threshold{10000};      /**< pools smaller than this use the flat index */
    HnswBuildParams hnsw{};                 /**< M=32, efConstruction=200 */
    std::uint32_t ef_search{100};           /**< HNSW beam width at query time */
    float norm_tolerance{1e-3f};            /**< rows further than this from unit norm are logged */
};

/** \brief One search hit. */
struct PoolHit {
    std::uint32_t position{};
    float score{};
    const metadata::Item* item{nullptr};    /**< points into the owning pool */
};

struct PoolStats {
    dataset kind{dataset::diamonds};
    std::size_t items{0};
    std::size_t dimension{0};
    IndexType index_type{IndexType::Flat};
    std::size_t renormalized_rows{0};
    std::optional<HnswStats> graph;          /**< set for HNSW pools */
};

class Pool {
public:
    Pool(Pool&&) noexcept;
    Pool& operator=(Pool&&) noexcept;
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    ~Pool();

    /** \brief Build from aligned embeddings and metadata.
     *
     * Errors: data_integrity on count mismatch, zero/non-finite rows or
     * duplicate ids; precondition_failed for invalid HNSW parameters.
     */
    static auto build(dataset kind, EmbeddingMatrix embeddings, std::vector<metadata::Item> items,
                      const PoolBuildConfig& config = {})
        -> std::expected<Pool, core::error>;

    /** \brief Load metadata and embedding files then build. */
    static auto load(dataset kind, const std::filesystem::path& metadata_path,
                     const std::filesystem::path& embeddings_path,
                     const PoolBuildConfig& config = {})
        -> std::expected<Pool, core::error>;

    /** \brief Top-k by inner product, optionally restricted by \p filters.
     *
     * \return at most min(k, eligible) hits, score descending, ties by position.
     * Errors: invalid_argument on query dimension mismatch or a filter bound
     * to another dataset.
     */
    auto search(std::span<const float> query, std::size_t k,
                const filter_criteria* filters = nullptr) const
        -> std::expected<std::vector<PoolHit>, core::error>;

    /** \brief Embedding by item id; not_found if the id is unknown. */
    auto embedding(std::string_view id) const -> std::expected<std::span<const float>, core::error>;

    auto position_of(std::string_view id) const -> std::optional<std::uint32_t>;
    auto embedding_at(std::uint32_t position) const noexcept -> std::span<const float>;
    auto item(std::uint32_t position) const noexcept -> const metadata::Item&;
    auto items() const noexcept -> std::span<const metadata::Item>;

    auto kind() const noexcept -> dataset;
    auto size() const noexcept -> std::size_t;
    auto dimension() const noexcept -> std::size_t;
    auto index_type() const noexcept -> IndexType;
    auto stats() const noexcept -> PoolStats;

private:
    class Impl;
    explicit Pool(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace facet::index
