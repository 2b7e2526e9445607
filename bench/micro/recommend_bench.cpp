/** \file recommend_bench.cpp
 *  \brief Combination recommendation and MMR re-ranking cost.
 */

#include <benchmark/benchmark.h>
#include "facet/index/pool_registry.hpp"
#include "facet/kernels/distance.hpp"
#include "facet/search/diversity.hpp"
#include "facet/search/recommender.hpp"
#include <random>
#include <string>
#include <vector>

using namespace facet;

namespace {

constexpr std::size_t kDim = 512;

std::vector<std::vector<float>> unit_rows(std::size_t n, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<std::vector<float>> rows(n, std::vector<float>(kDim));
    for (auto& r : rows) {
        for (auto& x : r) x = dist(gen);
        (void)kernels::normalize(r);
    }
    return rows;
}

index::Pool make_pool(dataset kind, std::size_t n, std::uint32_t seed) {
    static const char* kColors[] = {"D", "E", "F", "G", "H", "I", "J", "K"};
    static const char* kMetals[] = {"Platinum", "14k White Gold", "18k Yellow Gold", "Rose Gold"};
    static const char* kShapes[] = {"Round", "Oval", "Cushion", "Pear"};
    std::vector<metadata::Item> items(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto& it = items[i];
        it.id = std::to_string(i);
        if (kind == dataset::diamonds) {
            it.attributes["color"] = std::string(kColors[i % 8]);
            it.attributes["shape"] = std::string(kShapes[i % 4]);
            it.attributes["price"] = 2000.0 + static_cast<double>(i % 50) * 150.0;
            it.attributes["carat_weight"] = 0.3 + static_cast<double>(i % 20) * 0.1;
        } else {
            it.attributes["metal"] = std::string(kMetals[i % 4]);
            it.attributes["price"] = 800.0 + static_cast<double>(i % 30) * 60.0;
        }
    }
    auto m = index::make_matrix(unit_rows(n, seed));
    return std::move(index::Pool::build(kind, std::move(m.value()), std::move(items)).value());
}

} // namespace

static void BM_MmrRerank(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto rows = unit_rows(n, 3);
    std::vector<search::MmrCandidate> cands;
    cands.reserve(n);
    for (std::size_t i = 0; i < n; ++i) cands.push_back({1.0f - static_cast<float>(i) / static_cast<float>(n), rows[i]});
    for (auto _ : state) {
        auto picked = search::mmr_rerank(cands, 10, 0.1f);
        benchmark::DoNotOptimize(picked);
    }
}
BENCHMARK(BM_MmrRerank)->Arg(225)->Arg(900);

static void BM_RecommendCombinations(benchmark::State& state) {
    index::PoolRegistry registry(index::PoolRegistry::Loader{});
    registry.put(make_pool(dataset::diamonds, 5000, 11));
    registry.put(make_pool(dataset::settings, 2000, 12));
    search::RecommenderConfig cfg;
    cfg.max_candidates = static_cast<std::size_t>(state.range(0));
    search::Recommender rec(registry, nullptr, nullptr, {}, cfg);

    search::RecommendRequest req;
    req.query = unit_rows(1, 99).front();
    req.top_k = 10;
    req.query_text = "platinum round";
    for (auto _ : state) {
        auto r = rec.recommend(req);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_RecommendCombinations)->Arg(15)->Arg(30)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
