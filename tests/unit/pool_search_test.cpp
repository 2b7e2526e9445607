/** \file pool_search_test.cpp
 *  \brief Flat and HNSW nearest-neighbor search over pools.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "facet/filter_criteria.hpp"
#include "facet/index/flat_index.hpp"
#include "facet/index/hnsw.hpp"
#include "facet/index/pool.hpp"
#include "facet_test_helpers.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace facet;
using namespace facet::index;
using Catch::Matchers::WithinAbs;
using facet_test_helpers::make_item;

namespace {

std::vector<metadata::Item> numbered_items(std::size_t n) {
    std::vector<metadata::Item> items;
    items.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        items.push_back(make_item(std::to_string(i), {{"price", static_cast<double>(1000 * (i + 1))}}));
    }
    return items;
}

} // namespace

TEST_CASE("Querying with a pool vector returns it first", "[pool][search]") {
    const auto rows = facet_test_helpers::random_units(10, 768, 100);
    auto pool = facet_test_helpers::make_pool(dataset::diamonds, rows, numbered_items(10));
    REQUIRE(pool.index_type() == IndexType::Flat);
    REQUIRE_FALSE(pool.stats().graph.has_value());

    auto hits = pool.search(rows[0], 5);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 5);
    REQUIRE((*hits)[0].item->id == "0");
    REQUIRE_THAT((*hits)[0].score, WithinAbs(1.0, 1e-5));
    for (std::size_t i = 1; i < hits->size(); ++i) {
        REQUIRE((*hits)[i - 1].score >= (*hits)[i].score);
        REQUIRE((*hits)[i].score >= -1.0f - 1e-5f);
        REQUIRE((*hits)[i].score <= 1.0f + 1e-5f);
    }
}

TEST_CASE("Search returns at most min(k, eligible) hits", "[pool][search]") {
    const auto rows = facet_test_helpers::random_units(6, 32, 5);
    auto pool = facet_test_helpers::make_pool(dataset::diamonds, rows, numbered_items(6));

    auto all = pool.search(rows[2], 50);
    REQUIRE(all.has_value());
    REQUIRE(all->size() == 6);

    auto f = filter_criteria::parse(dataset::diamonds, {{"price_max", "3000"}});
    REQUIRE(f.has_value());
    auto filtered = pool.search(rows[5], 10, &*f);
    REQUIRE(filtered.has_value());
    REQUIRE(filtered->size() == 3);
    for (const auto& h : *filtered) REQUIRE(h.position < 3);
}

TEST_CASE("Equal scores are ordered by pool position", "[pool][search][ties]") {
    const std::vector<std::vector<float>> rows{{0.0f, 1.0f}, {1.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 0.0f}};
    auto pool = facet_test_helpers::make_pool(dataset::settings, rows, numbered_items(4));

    auto hits = pool.search(std::vector<float>{1.0f, 0.0f}, 3);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 3);
    REQUIRE((*hits)[0].position == 1);
    REQUIRE((*hits)[1].position == 2);
    REQUIRE((*hits)[2].position == 3);
}

TEST_CASE("Search rejects a wrong dimension and foreign filters", "[pool][search][errors]") {
    auto pool = facet_test_helpers::make_pool(dataset::diamonds, facet_test_helpers::random_units(3, 8, 9),
                                              numbered_items(3));

    auto dim = pool.search(std::vector<float>(4, 0.5f), 2);
    REQUIRE_FALSE(dim.has_value());
    REQUIRE(dim.error().code == core::error_code::invalid_argument);

    filter_criteria settings_filter(dataset::settings);
    auto foreign = pool.search(facet_test_helpers::random_unit(8, 1), 2, &settings_filter);
    REQUIRE_FALSE(foreign.has_value());
    REQUIRE(foreign.error().code == core::error_code::invalid_argument);

    auto missing = pool.embedding("nope");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == core::error_code::not_found);
    REQUIRE(pool.position_of("2").value() == 2);
}

TEST_CASE("Flat search honours a restriction bitmap", "[flat]") {
    auto m = make_matrix(facet_test_helpers::random_units(20, 16, 3));
    REQUIRE(m.has_value());
    roaring::Roaring allowed;
    allowed.add(4);
    allowed.add(11);
    allowed.add(17);

    const auto rows = flat_search(*m, m->row(0), 10, &allowed);
    REQUIRE(rows.size() == 3);
    std::set<std::uint32_t> got;
    for (const auto& r : rows) got.insert(r.position);
    REQUIRE(got == std::set<std::uint32_t>{4, 11, 17});
    REQUIRE(std::is_sorted(rows.begin(), rows.end(), ranks_before));
}

TEST_CASE("Auto selection switches to HNSW at the threshold", "[pool][hnsw]") {
    const std::size_t n = 400;
    const auto rows = facet_test_helpers::random_units(n, 32, 1000);

    PoolBuildConfig cfg;
    cfg.flat_threshold = n;
    cfg.hnsw.M = 16;
    cfg.hnsw.efConstruction = 100;
    auto pool = facet_test_helpers::make_pool(dataset::diamonds, rows, numbered_items(n), cfg);
    REQUIRE(pool.index_type() == IndexType::Hnsw);
    REQUIRE(pool.stats().index_type == IndexType::Hnsw);
    REQUIRE(pool.stats().items == n);
    const auto graph = pool.stats().graph;
    REQUIRE(graph.has_value());
    REQUIRE(graph->n_nodes == n);
    REQUIRE(graph->n_levels >= 1);
    REQUIRE(graph->n_edges > 0);
    REQUIRE(graph->avg_degree > 0.0f);

    auto m = make_matrix(rows);
    REQUIRE(m.has_value());

    // Recall@10 against exact search.
    std::size_t found = 0;
    const std::size_t queries = 20;
    for (std::size_t q = 0; q < queries; ++q) {
        const auto query = facet_test_helpers::random_unit(32, 50000 + static_cast<std::uint32_t>(q));
        const auto exact = flat_search(*m, query, 10);
        auto approx = pool.search(query, 10);
        REQUIRE(approx.has_value());
        REQUIRE(approx->size() == 10);
        REQUIRE(std::is_sorted(approx->begin(), approx->end(),
                               [](const PoolHit& a, const PoolHit& b) { return a.score > b.score; }));
        std::set<std::uint32_t> truth;
        for (const auto& r : exact) truth.insert(r.position);
        for (const auto& h : *approx) found += truth.count(h.position);
    }
    REQUIRE(static_cast<double>(found) / static_cast<double>(queries * 10) >= 0.9);

    // A self query finds itself.
    auto self = pool.search(rows[123], 1);
    REQUIRE(self.has_value());
    REQUIRE((*self)[0].position == 123);
}

TEST_CASE("Manual selection forces the index type", "[pool][hnsw]") {
    PoolBuildConfig cfg;
    cfg.strategy = SelectionStrategy::Manual;
    cfg.manual_type = IndexType::Hnsw;
    cfg.hnsw.M = 8;
    cfg.hnsw.efConstruction = 32;
    auto pool = facet_test_helpers::make_pool(dataset::settings, facet_test_helpers::random_units(50, 16, 77),
                                              numbered_items(50), cfg);
    REQUIRE(pool.index_type() == IndexType::Hnsw);

    // Filtered searches stay exact even on an HNSW pool.
    auto f = filter_criteria::parse(dataset::settings, {{"price_min", "49000"}});
    REQUIRE(f.has_value());
    auto hits = pool.search(facet_test_helpers::random_unit(16, 5), 5, &*f);
    REQUIRE(hits.has_value());
    REQUIRE(hits->size() == 2);
}

TEST_CASE("HNSW parameters are validated", "[hnsw]") {
    HnswIndex index;
    HnswBuildParams bad;
    bad.M = 1;
    REQUIRE_FALSE(index.init(8, bad).has_value());

    bad.M = 16;
    bad.efConstruction = 4;
    REQUIRE_FALSE(index.init(8, bad).has_value());

    REQUIRE_FALSE(index.init(0, HnswBuildParams{}).has_value());
}

TEST_CASE("robust_prune keeps at most M diverse neighbours", "[hnsw][prune]") {
    std::vector<std::pair<float, std::uint32_t>> cands;
    for (std::uint32_t i = 0; i < 20; ++i) cands.emplace_back(0.01f * static_cast<float>(i), i);
    auto [selected, discarded] = robust_prune(cands, 5, true);
    REQUIRE(selected.size() <= 5);
    REQUIRE_FALSE(selected.empty());
    REQUIRE(selected.size() + discarded.size() <= cands.size());
}
