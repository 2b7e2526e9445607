#include "facet/scoring/combination_scorer.hpp"

#include "facet/kernels/distance.hpp"
#include "facet/scoring/compatibility.hpp"

namespace facet::scoring {

auto CombinationScorer::score(const ScoredItem& diamond, const ScoredItem& setting,
                              std::optional<std::span<const float>> user_vector,
                              const QueryHints& hints, bool has_image) const -> ScoreBreakdown {
    ScoreBreakdown b;
    b.query_diamond_sim = diamond.query_similarity;
    b.query_setting_sim = setting.query_similarity;
    b.similarity = 0.5f * (diamond.query_similarity + setting.query_similarity);

    if (diamond.item && setting.item) {
        if (hints.any()) b.attribute_boost = attribute_boost(*diamond.item, *setting.item, hints);
        b.compatibility = compatibility(*diamond.item, *setting.item);
    }

    if (user_vector && !user_vector->empty()) {
        const bool have_both = !diamond.embedding.empty() &&
                               diamond.embedding.size() == setting.embedding.size() &&
                               diamond.embedding.size() == user_vector->size();
        if (have_both) {
            const auto pair = kernels::normalized_mean(diamond.embedding, setting.embedding);
            b.user_alignment = kernels::inner_product(*user_vector, pair);
        } else {
            b.user_alignment = b.similarity;
        }
    }

    const auto& w = weights(has_image);
    b.base_score = w.similarity * b.similarity + w.attribute * b.attribute_boost +
                   w.compatibility * b.compatibility + w.user * b.user_alignment;
    return b;
}

} // namespace facet::scoring
