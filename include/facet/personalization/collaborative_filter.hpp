#pragma once

/** \file collaborative_filter.hpp
 *  \brief User-user and item-item collaborative filtering for cold users.
 *
 * Interactions are indexed both ways (user -> items, item -> users). The
 * maps are rebuilt from the profile store at startup and updated
 * incrementally as interactions are logged. Item ids are qualified with
 * their dataset ("diamonds:123") so pools never collide.
 *
 * recommend() falls back in a fixed order:
 *   1. similar users (preference vectors, or interaction Jaccard when the
 *      user has no vector), their items weighted by similarity x type weight;
 *   2. item expansion from the user's own history (when step 1 yields nothing);
 *   3. content similarity of the query against the item embeddings
 *      (when the user has no usable history).
 *
 * Thread-safety: all members are safe for concurrent use; the maps are
 * guarded by a shared_mutex.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "facet/personalization/user_profile.hpp"

namespace facet::personalization {

class UserProfileStore;

using ScoredId = std::pair<std::string, float>;
using VectorMap = std::unordered_map<std::string, std::vector<float>>;

/** \brief Strategy that produced a recommendation list. */
enum class cf_strategy : std::uint8_t { none, similar_users, item_based, cold_start };

auto to_string(cf_strategy s) noexcept -> std::string_view;

struct CfRecommendations {
    cf_strategy strategy{cf_strategy::none};
    std::vector<ScoredId> items;     /**< score descending */
};

class CollaborativeFilter {
public:
    struct Config {
        std::size_t neighbors{20};        /**< similar users considered by recommend() */
        std::size_t similar_items{20};    /**< similar items per history entry */
    };

    CollaborativeFilter() = default;
    explicit CollaborativeFilter(const Config& config) : config_(config) {}

    /** \brief Index one interaction. */
    void record(std::string_view user_id, std::string_view item_id, interaction_type type, double timestamp);

    /** \brief Replace the maps with every interaction that carries an item id. */
    void rebuild_from(const UserProfileStore& store);

    /** \brief Inner product of preference vectors, excluding \p user_id itself. */
    auto user_similarity(std::string_view user_id, const VectorMap& user_vectors, std::size_t top_n) const
        -> std::vector<ScoredId>;

    /** \brief Jaccard overlap of interacted item sets. */
    auto user_similarity_by_interactions(std::string_view user_id, std::size_t top_n) const
        -> std::vector<ScoredId>;

    /** \brief Inner product of item embeddings, excluding \p item_id itself. */
    auto item_similarity(std::string_view item_id, const VectorMap& item_embeddings, std::size_t top_n) const
        -> std::vector<ScoredId>;

    /** \brief Jaccard overlap of the users that interacted with each item. */
    auto item_similarity_by_interactions(std::string_view item_id, std::size_t top_n) const
        -> std::vector<ScoredId>;

    /** \brief Collaborative recommendations; see the file comment for the order. */
    auto recommend(std::string_view user_id, const VectorMap& user_vectors, const VectorMap& item_embeddings,
                   std::optional<std::span<const float>> query, std::size_t top_n) const
        -> CfRecommendations;

    auto user_count() const -> std::size_t;
    auto item_count() const -> std::size_t;

private:
    struct Entry {
        std::string other;               /**< item id in users_, user id in items_ */
        interaction_type type;
        double timestamp;
    };

    using Index = std::unordered_map<std::string, std::vector<Entry>>;

    static auto jaccard_top(std::string_view key, const Index& index, std::size_t top_n) -> std::vector<ScoredId>;

    Config config_{};
    Index users_;
    Index items_;
    mutable std::shared_mutex mutex_;
};

/** \brief Keep the \p n best entries, score descending, ties by id. */
auto top_scored(std::vector<ScoredId> v, std::size_t n) -> std::vector<ScoredId>;

} // namespace facet::personalization
