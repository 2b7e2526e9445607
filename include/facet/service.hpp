#pragma once

/** \file service.hpp
 *  \brief Request boundary of the engine: validation plus wiring.
 *
 * The service owns the pool registry, the profile store, the collaborative
 * filter and the recommender, and is the only place where raw request input
 * (dataset names, raw filter maps, top_k) is validated. Everything behind it
 * works on validated types.
 *
 * Thread-safety: every member function may be called concurrently.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "facet/config.hpp"
#include "facet/dataset.hpp"
#include "facet/embedding/embedder.hpp"
#include "facet/error.hpp"
#include "facet/filter_criteria.hpp"
#include "facet/index/pool_registry.hpp"
#include "facet/personalization/collaborative_filter.hpp"
#include "facet/personalization/profile_store.hpp"
#include "facet/search/recommender.hpp"

namespace facet {

struct SearchHit {
    std::string id;
    float score{0.0f};
    const metadata::Item* item{nullptr};     /**< valid while SearchResult::pool is held */
};

struct SearchResult {
    std::vector<SearchHit> hits;
    std::shared_ptr<const index::Pool> pool;
};

struct ServiceStats {
    std::vector<index::PoolStats> pools;     /**< published pools only */
    std::uint64_t pool_builds{0};
    std::size_t users{0};
    std::size_t collaborative_users{0};
    std::size_t collaborative_items{0};
};

class Service {
public:
    Service(Service&&) noexcept;
    Service& operator=(Service&&) noexcept;
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    ~Service();

    /** \brief Validate \p config, load stored profiles and index their interactions.
     *
     * \param loader pool loader; defaults to the file loader over config.data_dir.
     * Pools are built lazily on first use.
     */
    static auto open(ServiceConfig config,
                     std::shared_ptr<const embedding::Embedder> embedder,
                     index::PoolRegistry::Loader loader = {})
        -> std::expected<Service, core::error>;

    /** \brief Top-k items of one dataset. Errors: invalid_query for an empty
     *  query or top_k outside [1, max_top_k]; invalid_argument when the
     *  filters belong to another dataset or the dimension is wrong.
     */
    auto search(dataset kind, std::span<const float> query, std::size_t top_k,
                const filter_criteria* filters = nullptr) const
        -> std::expected<SearchResult, core::error>;

    /** \brief Boundary overload: dataset name and raw filters are validated
     *  (unknown_dataset, unknown_filter_key, invalid_argument).
     */
    auto search(std::string_view dataset_name, std::span<const float> query, std::size_t top_k,
                const raw_filters& filters) const
        -> std::expected<SearchResult, core::error>;

    auto recommend_combinations(const search::RecommendRequest& request) const
        -> std::expected<search::RecommendResponse, core::error>;

    /** \brief Query vector from text and/or image through the injected embedder. */
    auto embed_query(std::optional<std::string_view> text,
                     std::optional<std::span<const std::uint8_t>> image) const
        -> std::expected<std::vector<float>, core::error>;

    auto update_preferences(std::string_view user_id, const personalization::PreferenceMap& prefs)
        -> std::expected<void, core::error>;

    /** \brief Log an interaction with an explicit embedding.
     *
     * weight defaults to the type weight, timestamp to now. An item id, when
     * given, also feeds the collaborative filter.
     */
    auto log_interaction(std::string_view user_id, std::vector<float> item_embedding,
                         personalization::interaction_type type,
                         std::optional<float> weight = std::nullopt,
                         std::optional<double> timestamp = std::nullopt,
                         std::optional<std::string> item_id = std::nullopt)
        -> std::expected<void, core::error>;

    /** \brief Log an interaction with a catalog item; not_found for unknown ids. */
    auto log_item_interaction(std::string_view user_id, dataset kind, std::string_view item_id,
                              personalization::interaction_type type)
        -> std::expected<void, core::error>;

    auto stats() const -> ServiceStats;

    auto config() const noexcept -> const ServiceConfig&;
    auto pools() noexcept -> index::PoolRegistry&;
    auto profiles() const noexcept -> const personalization::UserProfileStore&;
    auto collaborative() const noexcept -> const personalization::CollaborativeFilter&;

private:
    class Impl;
    explicit Service(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

} // namespace facet
