#pragma once

/** \file recommender.hpp
 *  \brief (diamond, setting) combination recommendations.
 *
 * Per request:
 *  1. resolve the user vector; cold or sparse users take the collaborative
 *     fallback;
 *  2. extract hints from the query text; an explicit shape is added to the
 *     diamond filters;
 *  3. search both pools for max_candidates hits each; an empty side ends the
 *     request with an empty result and a note;
 *  4. infer hints from the top candidates when the text gave none;
 *  5. pair candidates; explicit metal/color hints hard-filter the pairs,
 *     falling back to the full cross product when nothing matches;
 *  6. drop incompatible pairs unless that leaves fewer than top_k;
 *  7. score, add collaborative and sequential boosts, diversify with MMR and
 *     return the top_k by score.
 *
 * Pools are shared read-only; profiles and the collaborative filter are read
 * through their own locks. No state is kept between requests.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "facet/error.hpp"
#include "facet/filter_criteria.hpp"
#include "facet/index/pool.hpp"
#include "facet/index/pool_registry.hpp"
#include "facet/personalization/collaborative_filter.hpp"
#include "facet/personalization/profile_store.hpp"
#include "facet/scoring/combination_scorer.hpp"
#include "facet/scoring/query_hints.hpp"

namespace facet::search {

struct RecommenderConfig {
    std::size_t max_candidates{15};          /**< hits per pool */
    float diversity_weight{0.1f};            /**< MMR lambda; 0 disables re-ranking */
    std::size_t hint_top_n{5};               /**< candidates voting on inferred hints */
    bool use_sequential{true};
    std::size_t sequential_window{5};        /**< recent interactions forming the trend */
    std::size_t sequential_min_interactions{2};
    std::size_t collaborative_top_n{20};     /**< recommended items that earn the boost */
    scoring::BoostWeights boosts{};
};

struct RecommendRequest {
    std::vector<float> query;                        /**< unit query embedding */
    std::size_t top_k{10};
    std::optional<std::string> user_id;
    std::optional<filter_criteria> diamond_filters;
    std::optional<filter_criteria> setting_filters;
    std::optional<std::string> query_text;
    bool has_image{false};
    std::optional<std::size_t> max_candidates;       /**< overrides the config */
};

struct Combination {
    const metadata::Item* diamond{nullptr};
    const metadata::Item* setting{nullptr};
    float score{0.0f};
    double total_price{0.0};
    scoring::ScoreBreakdown breakdown{};
};

struct RecommendResponse {
    std::vector<Combination> combinations;           /**< score descending */
    std::string note;                                /**< set when the result is empty */
    scoring::QueryHints hints{};
    personalization::cf_strategy collaborative{personalization::cf_strategy::none};
    std::shared_ptr<const index::Pool> diamonds;     /**< keep the items alive */
    std::shared_ptr<const index::Pool> settings;
};

class Recommender {
public:
    /** \param profiles and \p collaborative may be null (no personalization). */
    Recommender(index::PoolRegistry& pools,
                const personalization::UserProfileStore* profiles,
                const personalization::CollaborativeFilter* collaborative,
                scoring::CombinationScorer scorer = {},
                RecommenderConfig config = {});

    /** \brief Ranked combinations for \p request.
     *
     * Errors: invalid_query for an empty query vector or top_k of 0; pool
     * build failures and search errors (dimension mismatch, filters bound to
     * the wrong dataset) are propagated.
     */
    auto recommend(const RecommendRequest& request) const
        -> std::expected<RecommendResponse, core::error>;

    auto config() const noexcept -> const RecommenderConfig& { return config_; }

private:
    index::PoolRegistry& pools_;
    const personalization::UserProfileStore* profiles_;
    const personalization::CollaborativeFilter* collaborative_;
    scoring::CombinationScorer scorer_;
    RecommenderConfig config_;
};

} // namespace facet::search
