#include "facet/search/recommender.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>
#include <utility>

#include "facet/core/platform_utils.hpp"
#include "facet/kernels/distance.hpp"
#include "facet/scoring/compatibility.hpp"
#include "facet/search/diversity.hpp"

namespace facet::search {

namespace {

struct Pair {
    std::size_t d;   // index into diamond hits
    std::size_t s;   // index into setting hits
};

auto items_of(const std::vector<index::PoolHit>& hits) -> std::vector<const metadata::Item*> {
    std::vector<const metadata::Item*> out;
    out.reserve(hits.size());
    for (const auto& h : hits) out.push_back(h.item);
    return out;
}

auto cross_product(std::size_t nd, std::size_t ns) -> std::vector<Pair> {
    std::vector<Pair> out;
    out.reserve(nd * ns);
    for (std::size_t d = 0; d < nd; ++d) {
        for (std::size_t s = 0; s < ns; ++s) out.push_back(Pair{d, s});
    }
    return out;
}

auto empty_response(std::string note, scoring::QueryHints hints) -> RecommendResponse {
    RecommendResponse r;
    r.note = std::move(note);
    r.hints = std::move(hints);
    return r;
}

} // namespace

Recommender::Recommender(index::PoolRegistry& pools,
                         const personalization::UserProfileStore* profiles,
                         const personalization::CollaborativeFilter* collaborative,
                         scoring::CombinationScorer scorer,
                         RecommenderConfig config)
    : pools_(pools),
      profiles_(profiles),
      collaborative_(collaborative),
      scorer_(scorer),
      config_(config) {}

auto Recommender::recommend(const RecommendRequest& request) const
    -> std::expected<RecommendResponse, core::error> {
    if (request.query.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_query, "Empty query vector", "recommend"});
    }
    if (request.top_k == 0) {
        return std::unexpected(core::error{core::error_code::invalid_query, "top_k must be positive", "recommend"});
    }
    const bool debug = core::debug_enabled();
    const double now = personalization::now_seconds();

    // 1. User state.
    std::optional<personalization::UserProfile> profile;
    std::optional<std::vector<float>> user_vector;
    bool collaborative_fallback = false;
    if (request.user_id && profiles_) {
        profile = profiles_->get(*request.user_id);
        if (profile) user_vector = personalization::hybrid_vector(*profile, now, profiles_->model());
        if (collaborative_) {
            collaborative_fallback = !user_vector ||
                                     !profile || personalization::is_sparse(*profile, profiles_->model());
        }
    }

    // 2. Explicit hints; an explicit shape becomes a diamond filter.
    auto hints = scoring::extract_query_hints(request.query_text.value_or(std::string{}));
    std::optional<filter_criteria> diamond_filters = request.diamond_filters;
    if (hints.shape_explicit && hints.shape) {
        if (!diamond_filters) diamond_filters.emplace(dataset::diamonds);
        if (auto r = diamond_filters->set_values("shape", {*hints.shape}); !r) return std::unexpected(r.error());
    }

    // 3. Candidates.
    auto diamonds = pools_.get(dataset::diamonds);
    if (!diamonds) return std::unexpected(diamonds.error());
    auto settings = pools_.get(dataset::settings);
    if (!settings) return std::unexpected(settings.error());

    const std::size_t max_candidates = request.max_candidates.value_or(config_.max_candidates);
    auto d_hits = (*diamonds)->search(request.query, max_candidates,
                                      diamond_filters ? &*diamond_filters : nullptr);
    if (!d_hits) return std::unexpected(d_hits.error());
    auto s_hits = (*settings)->search(request.query, max_candidates,
                                      request.setting_filters ? &*request.setting_filters : nullptr);
    if (!s_hits) return std::unexpected(s_hits.error());

    if (d_hits->empty() || s_hits->empty()) {
        auto note = std::string("No ") + (d_hits->empty() ? "diamond" : "setting") +
                    " candidates matched the query and filters";
        if (debug) std::cerr << "[RECOMMEND] " << note << std::endl;
        return empty_response(std::move(note), std::move(hints));
    }

    // 4. Inferred hints steer scoring only.
    if (!hints.any()) {
        const auto top_d = items_of(*d_hits);
        const auto top_s = items_of(*s_hits);
        hints = scoring::infer_hints(std::move(hints), top_d, top_s, config_.hint_top_n);
    }

    // 5. Pairing.
    auto all_pairs = cross_product(d_hits->size(), s_hits->size());
    std::vector<Pair> candidate_pairs;
    if (hints.any()) {
        for (const auto& p : all_pairs) {
            const auto& d = *(*d_hits)[p.d].item;
            const auto& s = *(*s_hits)[p.s].item;
            if (hints.metal_explicit && hints.metal && !scoring::metal_matches(s, *hints.metal)) continue;
            if (hints.color_explicit && hints.color && !scoring::color_matches(d, *hints.color)) continue;
            candidate_pairs.push_back(p);
        }
    }
    if (candidate_pairs.empty()) candidate_pairs = all_pairs;

    // 6. Prefilter.
    std::vector<Pair> pairs;
    pairs.reserve(candidate_pairs.size());
    for (const auto& p : candidate_pairs) {
        if (scoring::quick_compatibility_check(*(*d_hits)[p.d].item, *(*s_hits)[p.s].item)) pairs.push_back(p);
    }
    if (pairs.size() < request.top_k) pairs = candidate_pairs;

    // Pair embeddings feed the sequential trend and MMR. A pair whose
    // embeddings cancel out has no usable direction and is skipped.
    std::vector<std::vector<float>> pair_embeddings;
    pair_embeddings.reserve(pairs.size());
    std::size_t skipped = 0;
    {
        std::vector<Pair> usable;
        usable.reserve(pairs.size());
        for (const auto& p : pairs) {
            auto e = kernels::normalized_mean((*diamonds)->embedding_at((*d_hits)[p.d].position),
                                              (*settings)->embedding_at((*s_hits)[p.s].position));
            if (!(kernels::l2_norm(e) > 0.5f)) {
                ++skipped;
                continue;
            }
            usable.push_back(p);
            pair_embeddings.push_back(std::move(e));
        }
        pairs = std::move(usable);
    }

    // 7a. Collaborative boost: pairs holding an item the filter recommends.
    RecommendResponse response;
    std::unordered_set<std::string> boosted;
    if (collaborative_fallback) {
        personalization::VectorMap item_embeddings;
        for (const auto& h : *d_hits) {
            const auto v = (*diamonds)->embedding_at(h.position);
            item_embeddings.emplace(qualified_id(dataset::diamonds, h.item->id), std::vector<float>(v.begin(), v.end()));
        }
        for (const auto& h : *s_hits) {
            const auto v = (*settings)->embedding_at(h.position);
            item_embeddings.emplace(qualified_id(dataset::settings, h.item->id), std::vector<float>(v.begin(), v.end()));
        }
        if (profile) {
            for (const auto& e : profile->interactions) {
                if (e.item_id && e.embedding.size() == request.query.size()) item_embeddings.emplace(*e.item_id, e.embedding);
            }
        }
        const auto recs = collaborative_->recommend(*request.user_id, profiles_->all_vectors(now), item_embeddings,
                                                    std::span<const float>(request.query), config_.collaborative_top_n);
        response.collaborative = recs.strategy;
        for (const auto& [id, _] : recs.items) boosted.insert(id);
        if (debug) {
            std::cerr << "[RECOMMEND][collaborative] user=" << *request.user_id << " strategy="
                      << personalization::to_string(recs.strategy) << " items=" << recs.items.size() << std::endl;
        }
    }

    // 7b. Sequential trend.
    std::optional<std::vector<float>> trend;
    if (config_.use_sequential && profile &&
        profile->interactions.size() >= config_.sequential_min_interactions) {
        trend = personalization::recent_trend(*profile, config_.sequential_window);
    }

    // 7c. Score.
    std::vector<Combination> combos;
    combos.reserve(pairs.size());
    std::optional<std::span<const float>> user_span;
    if (user_vector) user_span = std::span<const float>(*user_vector);
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        const auto& dh = (*d_hits)[pairs[i].d];
        const auto& sh = (*s_hits)[pairs[i].s];
        scoring::ScoredItem d{dh.item, dh.score, (*diamonds)->embedding_at(dh.position)};
        scoring::ScoredItem s{sh.item, sh.score, (*settings)->embedding_at(sh.position)};
        auto b = scorer_.score(d, s, user_span, hints, request.has_image);
        if (!boosted.empty() && (boosted.count(qualified_id(dataset::diamonds, dh.item->id)) ||
                                 boosted.count(qualified_id(dataset::settings, sh.item->id)))) {
            b.collaborative_boost = 1.0f;
        }
        if (trend && trend->size() == pair_embeddings[i].size()) {
            b.sequential_boost = std::max(0.0f, kernels::inner_product(*trend, pair_embeddings[i]));
        }
        Combination c;
        c.diamond = dh.item;
        c.setting = sh.item;
        c.breakdown = b;
        c.score = b.final_score(config_.boosts);
        c.total_price = metadata::price_or_zero(*dh.item) + metadata::price_or_zero(*sh.item);
        combos.push_back(c);
    }

    // 8. Diversify, then rank.
    if (config_.diversity_weight > 0.0f && combos.size() > request.top_k) {
        std::vector<MmrCandidate> mmr;
        mmr.reserve(combos.size());
        for (std::size_t i = 0; i < combos.size(); ++i) mmr.push_back(MmrCandidate{combos[i].score, pair_embeddings[i]});
        const auto picked = mmr_rerank(mmr, request.top_k, config_.diversity_weight);
        std::vector<Combination> diverse;
        diverse.reserve(picked.size());
        for (auto idx : picked) diverse.push_back(combos[idx]);
        combos = std::move(diverse);
    }
    std::stable_sort(combos.begin(), combos.end(),
                     [](const Combination& a, const Combination& b) { return a.score > b.score; });
    if (combos.size() > request.top_k) combos.resize(request.top_k);

    if (debug) {
        std::cerr << "[RECOMMEND] diamonds=" << d_hits->size() << " settings=" << s_hits->size()
                  << " pairs=" << pairs.size() << " skipped=" << skipped << " returned=" << combos.size()
                  << " metal=" << hints.metal.value_or("-") << " color=" << hints.color.value_or("-")
                  << " shape=" << hints.shape.value_or("-") << std::endl;
    }

    if (combos.empty()) response.note = "No scorable diamond/setting pairs";
    response.combinations = std::move(combos);
    response.hints = std::move(hints);
    response.diamonds = *diamonds;
    response.settings = *settings;
    return response;
}

} // namespace facet::search
