/** \file hnsw.cpp
 *  \brief HNSW graph construction and search over unit vectors.
 *
 * Distances inside the graph are 1 - <a,b>, so smaller is closer; search
 * converts them back to inner-product similarity.
 */

#include "facet/index/hnsw.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <random>

#include "facet/kernels/distance.hpp"

namespace facet::index {

/** \brief Node in HNSW graph. */
struct HnswNode {
    std::vector<float> data;
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
    std::uint32_t level{0};
};

class HnswIndex::Impl {
public:
    struct State {
        bool initialized{false};
        std::size_t dim{0};
        HnswBuildParams params;
        std::uint32_t max_M{32};
        std::uint32_t max_M0{64};
        std::uint32_t entry_point{std::numeric_limits<std::uint32_t>::max()};
        float level_multiplier{1.0f / std::log(2.0f)};
        std::mt19937 rng;
    } state_;

    std::vector<HnswNode> nodes_;

    auto init(std::size_t dim, const HnswBuildParams& params, std::size_t max_elements)
        -> std::expected<void, core::error>;
    auto add(std::span<const float> vec) -> std::expected<std::uint32_t, core::error>;
    auto search(std::span<const float> query, const HnswSearchParams& params) const
        -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error>;

    auto select_level() -> std::uint32_t;
    auto distance(std::span<const float> q, std::uint32_t idx) const -> float;
    auto search_layer(std::span<const float> query, std::uint32_t entry_point,
                      std::uint32_t num_closest, std::uint32_t layer) const
        -> std::vector<std::pair<float, std::uint32_t>>;
    auto connect_node(std::uint32_t new_idx,
                      const std::vector<std::pair<float, std::uint32_t>>& candidates,
                      std::uint32_t M, std::uint32_t level) -> void;
};

auto HnswIndex::Impl::init(std::size_t dim, const HnswBuildParams& params,
                           std::size_t max_elements)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (dim == 0) {
        return std::unexpected(error{error_code::precondition_failed, "Dimension must be > 0", "hnsw"});
    }
    if (params.M < 2) {
        return std::unexpected(error{error_code::precondition_failed, "M must be >= 2", "hnsw"});
    }
    if (params.efConstruction < params.M) {
        return std::unexpected(error{error_code::precondition_failed, "efConstruction must be >= M", "hnsw"});
    }

    state_.dim = dim;
    state_.params = params;
    state_.max_M = params.M;
    state_.max_M0 = 2u * params.M;
    state_.rng.seed(params.seed);
    // Standard HNSW level multiplier based on M
    state_.level_multiplier = 1.0f / std::log(static_cast<float>(params.M));
    state_.initialized = true;
    nodes_.clear();
    nodes_.reserve(max_elements);
    state_.entry_point = std::numeric_limits<std::uint32_t>::max();
    return {};
}

auto HnswIndex::Impl::select_level() -> std::uint32_t {
    std::uniform_real_distribution<float> dist(std::numeric_limits<float>::min(), 1.0f);
    const float f = -std::log(dist(state_.rng)) * state_.level_multiplier;
    return static_cast<std::uint32_t>(f);
}

auto HnswIndex::Impl::distance(std::span<const float> q, std::uint32_t idx) const -> float {
    return 1.0f - kernels::inner_product(q, nodes_[idx].data);
}

auto HnswIndex::Impl::search_layer(std::span<const float> query, std::uint32_t entry_point,
                                   std::uint32_t num_closest, std::uint32_t layer) const
    -> std::vector<std::pair<float, std::uint32_t>> {
    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }

    // candidates: min-heap via negated distance; nearest: max-heap of the current best
    std::priority_queue<std::pair<float, std::uint32_t>> candidates;
    std::priority_queue<std::pair<float, std::uint32_t>> nearest;

    const float entry_dist = distance(query, entry_point);
    candidates.emplace(-entry_dist, entry_point);
    nearest.emplace(entry_dist, entry_point);
    tls.seen[entry_point] = tls.epoch;

    while (!candidates.empty()) {
        const auto [neg_dist, current] = candidates.top();
        candidates.pop();
        if (-neg_dist > nearest.top().first) break;

        const auto& node = nodes_[current];
        if (layer >= node.neighbors.size()) continue;
        for (std::uint32_t neighbor : node.neighbors[layer]) {
            if (tls.seen[neighbor] == tls.epoch) continue;
            tls.seen[neighbor] = tls.epoch;
            const float dist = distance(query, neighbor);
            if (nearest.size() < num_closest || dist < nearest.top().first) {
                candidates.emplace(-dist, neighbor);
                nearest.emplace(dist, neighbor);
                if (nearest.size() > num_closest) nearest.pop();
            }
        }
    }

    std::vector<std::pair<float, std::uint32_t>> result;
    result.reserve(nearest.size());
    while (!nearest.empty()) {
        result.push_back(nearest.top());
        nearest.pop();
    }
    // Deterministic ordering on ties (distance, then index)
    std::sort(result.begin(), result.end());
    return result;
}

auto HnswIndex::Impl::connect_node(std::uint32_t new_idx,
                                   const std::vector<std::pair<float, std::uint32_t>>& candidates,
                                   std::uint32_t M, std::uint32_t level) -> void {
    auto candidates_copy = candidates;
    auto [selected, discarded] = robust_prune(candidates_copy, M, state_.params.extend_candidates);
    (void)discarded;
    nodes_[new_idx].neighbors[level] = selected;

    // Reverse edges with back-pruning
    const std::uint32_t max_conn = (level == 0) ? state_.max_M0 : state_.max_M;
    for (std::uint32_t neighbor : selected) {
        auto& nn = nodes_[neighbor].neighbors[level];
        if (std::find(nn.begin(), nn.end(), new_idx) != nn.end()) continue;
        if (nn.size() < max_conn) {
            nn.push_back(new_idx);
            continue;
        }
        const auto& base = nodes_[neighbor].data;
        std::vector<std::pair<float, std::uint32_t>> pool;
        pool.reserve(nn.size() + 1);
        for (std::uint32_t other : nn) pool.emplace_back(distance(base, other), other);
        pool.emplace_back(distance(base, new_idx), new_idx);
        auto [kept, dropped] = robust_prune(pool, max_conn, state_.params.extend_candidates);
        (void)dropped;
        nn = std::move(kept);
    }
}

auto HnswIndex::Impl::add(std::span<const float> vec) -> std::expected<std::uint32_t, core::error> {
    using core::error;
    using core::error_code;

    if (!state_.initialized) {
        return std::unexpected(error{error_code::precondition_failed, "Index not initialized", "hnsw"});
    }
    if (vec.size() != state_.dim) {
        return std::unexpected(error{error_code::invalid_argument, "Vector dimension mismatch", "hnsw"});
    }

    const auto new_idx = static_cast<std::uint32_t>(nodes_.size());
    const std::uint32_t level = select_level();
    HnswNode node;
    node.data.assign(vec.begin(), vec.end());
    node.level = level;
    node.neighbors.resize(level + 1);
    nodes_.push_back(std::move(node));

    // First node becomes entry point
    if (new_idx == 0) {
        state_.entry_point = 0;
        return new_idx;
    }

    std::uint32_t curr_nearest = state_.entry_point;
    const std::uint32_t ep_level = nodes_[curr_nearest].level;

    // Greedy descent through layers above the new node's level
    for (std::int32_t lc = static_cast<std::int32_t>(ep_level); lc > static_cast<std::int32_t>(level); --lc) {
        auto nearest = search_layer(vec, curr_nearest, 1, static_cast<std::uint32_t>(lc));
        if (!nearest.empty()) curr_nearest = nearest[0].second;
    }

    // Insert on every shared layer, base layer last
    for (std::int32_t lc = static_cast<std::int32_t>(std::min(level, ep_level)); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto nearest = search_layer(vec, curr_nearest, state_.params.efConstruction, layer);
        connect_node(new_idx, nearest, layer == 0 ? state_.max_M0 : state_.max_M, layer);
        if (!nearest.empty()) curr_nearest = nearest[0].second;
    }

    if (level > ep_level) state_.entry_point = new_idx;
    return new_idx;
}

auto HnswIndex::Impl::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error> {
    using core::error;
    using core::error_code;

    if (!state_.initialized || nodes_.empty()) {
        return std::unexpected(error{error_code::precondition_failed, "Index not initialized or empty", "hnsw"});
    }
    if (query.size() != state_.dim) {
        return std::unexpected(error{error_code::invalid_argument, "Query dimension mismatch", "hnsw"});
    }

    std::uint32_t curr_nearest = state_.entry_point;
    for (std::int32_t lc = static_cast<std::int32_t>(nodes_[curr_nearest].level); lc > 0; --lc) {
        auto nearest = search_layer(query, curr_nearest, 1, static_cast<std::uint32_t>(lc));
        if (!nearest.empty()) curr_nearest = nearest[0].second;
    }

    const std::uint32_t ef = std::max(params.efSearch, params.k);
    auto candidates = search_layer(query, curr_nearest, ef, 0);

    std::vector<std::pair<std::uint32_t, float>> results;
    const std::size_t n = std::min(static_cast<std::size_t>(params.k), candidates.size());
    results.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& [dist, idx] = candidates[i];
        if (!std::isfinite(dist)) continue;
        results.emplace_back(idx, 1.0f - dist);
    }
    return results;
}

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, const HnswBuildParams& params, std::size_t max_elements)
    -> std::expected<void, core::error> {
    return impl_->init(dim, params, max_elements);
}

auto HnswIndex::add(std::span<const float> vec) -> std::expected<std::uint32_t, core::error> {
    return impl_->add(vec);
}

auto HnswIndex::search(std::span<const float> query, const HnswSearchParams& params) const
    -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::get_stats() const noexcept -> HnswStats {
    HnswStats stats;
    stats.n_nodes = impl_->nodes_.size();
    for (const auto& node : impl_->nodes_) {
        stats.n_levels = std::max<std::size_t>(stats.n_levels, node.level + 1);
        for (const auto& layer : node.neighbors) stats.n_edges += layer.size();
    }
    if (stats.n_nodes > 0) {
        stats.avg_degree = static_cast<float>(stats.n_edges) / static_cast<float>(stats.n_nodes);
    }
    return stats;
}

auto HnswIndex::dimension() const noexcept -> std::size_t { return impl_->state_.dim; }
auto HnswIndex::size() const noexcept -> std::size_t { return impl_->nodes_.size(); }

auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M, bool extend_candidates)
    -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>> {
    if (candidates.empty() || M == 0) return {{}, {}};

    std::sort(candidates.begin(), candidates.end());

    std::vector<std::uint32_t> R;      // Result set
    std::vector<std::uint32_t> W_d;    // Discarded candidates

    // Always include closest neighbor for connectivity
    R.push_back(candidates[0].second);

    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const auto& [dist_c, c_idx] = candidates[i];
        if (R.size() >= M) {
            W_d.push_back(c_idx);
            continue;
        }
        // First M/2 slots build connectivity; the rest only take candidates
        // clearly farther than the nearest one (longer-range edges).
        const bool is_diverse = R.size() < M / 2 || dist_c > candidates[0].first * 1.5f;
        if (is_diverse) {
            R.push_back(c_idx);
        } else {
            W_d.push_back(c_idx);
        }
    }

    if (extend_candidates && R.size() < M && !W_d.empty()) {
        const std::size_t to_add = std::min<std::size_t>(M - R.size(), W_d.size());
        R.insert(R.end(), W_d.begin(), W_d.begin() + static_cast<std::ptrdiff_t>(to_add));
        W_d.erase(W_d.begin(), W_d.begin() + static_cast<std::ptrdiff_t>(to_add));
    }
    return {R, W_d};
}

} // namespace facet::index
