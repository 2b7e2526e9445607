#include "facet/personalization/collaborative_filter.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

#include "facet/kernels/distance.hpp"
#include "facet/personalization/profile_store.hpp"

namespace facet::personalization {

namespace {

auto id_set(const std::vector<std::string>& ids) -> std::unordered_set<std::string> {
    return {ids.begin(), ids.end()};
}

auto jaccard(const std::unordered_set<std::string>& a, const std::unordered_set<std::string>& b) -> float {
    std::size_t inter = 0;
    for (const auto& x : a) inter += b.count(x);
    const std::size_t uni = a.size() + b.size() - inter;
    return uni == 0 ? 0.0f : static_cast<float>(inter) / static_cast<float>(uni);
}

auto vector_top(std::string_view key, const VectorMap& vectors, std::size_t top_n) -> std::vector<ScoredId> {
    auto it = vectors.find(std::string(key));
    if (it == vectors.end()) return {};
    std::vector<ScoredId> out;
    out.reserve(vectors.size());
    for (const auto& [other, v] : vectors) {
        if (other == it->first || v.size() != it->second.size()) continue;
        out.emplace_back(other, kernels::inner_product(it->second, v));
    }
    return top_scored(std::move(out), top_n);
}

auto accumulate_sorted(const std::unordered_map<std::string, float>& scores, std::size_t top_n)
    -> std::vector<ScoredId> {
    return top_scored({scores.begin(), scores.end()}, top_n);
}

} // namespace

auto to_string(cf_strategy s) noexcept -> std::string_view {
    switch (s) {
        case cf_strategy::none: return "none";
        case cf_strategy::similar_users: return "similar_users";
        case cf_strategy::item_based: return "item_based";
        case cf_strategy::cold_start: return "cold_start";
    }
    return "none";
}

auto top_scored(std::vector<ScoredId> v, std::size_t n) -> std::vector<ScoredId> {
    auto better = [](const ScoredId& a, const ScoredId& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    };
    if (v.size() > n) {
        std::partial_sort(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(n), v.end(), better);
        v.resize(n);
    } else {
        std::sort(v.begin(), v.end(), better);
    }
    return v;
}

void CollaborativeFilter::record(std::string_view user_id, std::string_view item_id,
                                 interaction_type type, double timestamp) {
    if (user_id.empty() || item_id.empty()) return;
    std::unique_lock lock(mutex_);
    users_[std::string(user_id)].push_back(Entry{std::string(item_id), type, timestamp});
    items_[std::string(item_id)].push_back(Entry{std::string(user_id), type, timestamp});
}

void CollaborativeFilter::rebuild_from(const UserProfileStore& store) {
    Index users;
    Index items;
    for (const auto& uid : store.user_ids()) {
        auto p = store.get(uid);
        if (!p) continue;
        for (const auto& e : p->interactions) {
            if (!e.item_id || e.item_id->empty()) continue;
            users[uid].push_back(Entry{*e.item_id, e.type, e.timestamp});
            items[*e.item_id].push_back(Entry{uid, e.type, e.timestamp});
        }
    }
    std::unique_lock lock(mutex_);
    users_ = std::move(users);
    items_ = std::move(items);
}

auto CollaborativeFilter::user_similarity(std::string_view user_id, const VectorMap& user_vectors,
                                          std::size_t top_n) const -> std::vector<ScoredId> {
    return vector_top(user_id, user_vectors, top_n);
}

auto CollaborativeFilter::item_similarity(std::string_view item_id, const VectorMap& item_embeddings,
                                          std::size_t top_n) const -> std::vector<ScoredId> {
    return vector_top(item_id, item_embeddings, top_n);
}

auto CollaborativeFilter::jaccard_top(std::string_view key, const Index& index, std::size_t top_n)
    -> std::vector<ScoredId> {
    auto it = index.find(std::string(key));
    if (it == index.end()) return {};
    auto others_of = [](const std::vector<Entry>& entries) {
        std::vector<std::string> ids;
        ids.reserve(entries.size());
        for (const auto& e : entries) ids.push_back(e.other);
        return id_set(ids);
    };
    const auto target = others_of(it->second);
    std::vector<ScoredId> out;
    for (const auto& [other, entries] : index) {
        if (other == it->first) continue;
        out.emplace_back(other, jaccard(target, others_of(entries)));
    }
    return top_scored(std::move(out), top_n);
}

auto CollaborativeFilter::user_similarity_by_interactions(std::string_view user_id, std::size_t top_n) const
    -> std::vector<ScoredId> {
    std::shared_lock lock(mutex_);
    return jaccard_top(user_id, users_, top_n);
}

auto CollaborativeFilter::item_similarity_by_interactions(std::string_view item_id, std::size_t top_n) const
    -> std::vector<ScoredId> {
    std::shared_lock lock(mutex_);
    return jaccard_top(item_id, items_, top_n);
}

auto CollaborativeFilter::recommend(std::string_view user_id, const VectorMap& user_vectors,
                                    const VectorMap& item_embeddings,
                                    std::optional<std::span<const float>> query,
                                    std::size_t top_n) const -> CfRecommendations {
    CfRecommendations out;
    if (top_n == 0) return out;

    std::shared_lock lock(mutex_);
    const bool has_vector = user_vectors.count(std::string(user_id)) > 0;
    auto similar = has_vector ? vector_top(user_id, user_vectors, config_.neighbors)
                              : jaccard_top(user_id, users_, config_.neighbors);
    // Zero-overlap neighbours carry no signal.
    if (!has_vector) {
        similar.erase(std::remove_if(similar.begin(), similar.end(),
                                     [](const ScoredId& s) { return !(s.second > 0.0f); }),
                      similar.end());
    }

    if (!similar.empty()) {
        std::unordered_map<std::string, float> scores;
        for (const auto& [other, sim] : similar) {
            auto it = users_.find(other);
            if (it == users_.end()) continue;
            for (const auto& e : it->second) scores[e.other] += sim * default_weight(e.type);
        }
        if (!scores.empty()) {
            out.strategy = cf_strategy::similar_users;
            out.items = accumulate_sorted(scores, top_n);
            return out;
        }
    }

    if (auto it = users_.find(std::string(user_id)); it != users_.end() && !it->second.empty()) {
        std::unordered_map<std::string, float> scores;
        for (const auto& e : it->second) {
            auto neighbours = item_embeddings.count(e.other)
                                  ? vector_top(e.other, item_embeddings, config_.similar_items)
                                  : jaccard_top(e.other, items_, config_.similar_items);
            for (const auto& [item, sim] : neighbours) scores[item] += sim * default_weight(e.type);
        }
        if (!scores.empty()) {
            out.strategy = cf_strategy::item_based;
            out.items = accumulate_sorted(scores, top_n);
            return out;
        }
    }

    if (query && !query->empty()) {
        std::vector<ScoredId> sims;
        sims.reserve(item_embeddings.size());
        for (const auto& [item, emb] : item_embeddings) {
            if (emb.size() != query->size()) continue;
            sims.emplace_back(item, kernels::inner_product(*query, emb));
        }
        out.strategy = cf_strategy::cold_start;
        out.items = top_scored(std::move(sims), top_n);
    }
    return out;
}

auto CollaborativeFilter::user_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return users_.size();
}

auto CollaborativeFilter::item_count() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return items_.size();
}

} // namespace facet::personalization
