#pragma once

/** \file combination_scorer.hpp
 *  \brief Hierarchical weighted score of a (diamond, setting) pair.
 *
 *   score = w_sim * (sim_d + sim_s) / 2
 *         + w_attr * attribute_boost
 *         + w_comp * compatibility
 *         + w_user * user_alignment
 *
 * Weight presets depend on whether the query carried an image. Boosts from
 * collaborative filtering and the sequential trend are added on top by the
 * recommender (see ScoreBreakdown::final_score).
 */

#include <optional>
#include <span>

#include "facet/metadata/item.hpp"
#include "facet/scoring/query_hints.hpp"

namespace facet::scoring {

/** \brief Component weights of the base score. */
struct ScoringWeights {
    float similarity{0.3f};
    float attribute{0.4f};
    float compatibility{0.2f};
    float user{0.1f};

    /** \brief Preset for queries that include an image. */
    static constexpr auto image_preset() noexcept -> ScoringWeights { return {0.5f, 0.3f, 0.1f, 0.1f}; }
    /** \brief Preset for text-only queries. */
    static constexpr auto text_preset() noexcept -> ScoringWeights { return {0.3f, 0.4f, 0.2f, 0.1f}; }
};

/** \brief Weights of the additive boosts. */
struct BoostWeights {
    float collaborative{0.2f};
    float sequential{0.15f};
};

/** \brief Individual score components of one pair. */
struct ScoreBreakdown {
    float query_diamond_sim{0.0f};
    float query_setting_sim{0.0f};
    float similarity{0.0f};
    float attribute_boost{0.0f};
    float compatibility{0.0f};
    float user_alignment{0.0f};
    float collaborative_boost{0.0f};
    float sequential_boost{0.0f};
    float base_score{0.0f};           /**< weighted sum before boosts */

    auto final_score(const BoostWeights& b) const noexcept -> float {
        return base_score + b.collaborative * collaborative_boost + b.sequential * sequential_boost;
    }
};

/** \brief One side of a pair as seen by the scorer. */
struct ScoredItem {
    const metadata::Item* item{nullptr};
    float query_similarity{0.0f};
    std::span<const float> embedding{};   /**< empty when the lookup failed */
};

class CombinationScorer {
public:
    CombinationScorer() = default;
    CombinationScorer(ScoringWeights image, ScoringWeights text) : image_(image), text_(text) {}

    auto weights(bool has_image) const noexcept -> const ScoringWeights& {
        return has_image ? image_ : text_;
    }

    /** \brief Base score and its components.
     *
     * Alignment is the inner product of \p user_vector with the normalized
     * mean of both embeddings; 0 without a user vector, and the averaged
     * query similarity when either embedding is unavailable.
     */
    auto score(const ScoredItem& diamond, const ScoredItem& setting,
               std::optional<std::span<const float>> user_vector,
               const QueryHints& hints, bool has_image) const -> ScoreBreakdown;

private:
    ScoringWeights image_{ScoringWeights::image_preset()};
    ScoringWeights text_{ScoringWeights::text_preset()};
};

} // namespace facet::scoring
