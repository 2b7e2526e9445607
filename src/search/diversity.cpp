#include "facet/search/diversity.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

#include "facet/kernels/distance.hpp"

namespace facet::search {

auto mmr_rerank(std::span<const MmrCandidate> candidates, std::size_t k, float lambda)
    -> std::vector<std::size_t> {
    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (candidates.size() <= k) return order;

    // Relevance order with input order kept among equals.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return candidates[a].relevance > candidates[b].relevance;
    });

    std::vector<std::size_t> selected;
    selected.reserve(k);
    if (k == 0) return selected;
    selected.push_back(order.front());
    std::vector<std::size_t> remaining(order.begin() + 1, order.end());
    // max_sim of every remaining candidate to the selected set, updated incrementally.
    std::vector<float> max_sim(remaining.size(), 0.0f);

    auto sim = [&](std::size_t a, std::size_t b) -> float {
        const auto& ea = candidates[a].embedding;
        const auto& eb = candidates[b].embedding;
        if (ea.empty() || ea.size() != eb.size()) return 0.0f;
        return kernels::inner_product(ea, eb);
    };

    while (selected.size() < k && !remaining.empty()) {
        const std::size_t last = selected.back();
        std::size_t best = 0;
        float best_mmr = -std::numeric_limits<float>::infinity();
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            max_sim[i] = std::max(max_sim[i], sim(remaining[i], last));
            const float mmr = candidates[remaining[i]].relevance - lambda * max_sim[i];
            if (mmr > best_mmr) {
                best_mmr = mmr;
                best = i;
            }
        }
        selected.push_back(remaining[best]);
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(best));
        max_sim.erase(max_sim.begin() + static_cast<std::ptrdiff_t>(best));
    }
    return selected;
}

} // namespace facet::search
