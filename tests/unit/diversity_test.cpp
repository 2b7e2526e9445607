/** \file diversity_test.cpp
 *  \brief MMR selection behaviour.
 */

#include <catch2/catch_test_macros.hpp>

#include "facet/search/diversity.hpp"
#include "facet_test_helpers.hpp"

#include <algorithm>
#include <set>
#include <vector>

using namespace facet::search;

TEST_CASE("Zero lambda is pure relevance order", "[mmr]") {
    const auto e = facet_test_helpers::random_units(6, 8, 40);
    std::vector<MmrCandidate> c;
    const float rel[] = {0.2f, 0.9f, 0.5f, 0.7f, 0.1f, 0.6f};
    for (std::size_t i = 0; i < 6; ++i) c.push_back({rel[i], e[i]});

    const auto picked = mmr_rerank(c, 4, 0.0f);
    REQUIRE(picked == std::vector<std::size_t>{1, 3, 5, 2});
}

TEST_CASE("Near duplicates are pushed down", "[mmr]") {
    const auto a = facet_test_helpers::axis(3, 0);
    const auto b = facet_test_helpers::axis(3, 1);
    std::vector<MmrCandidate> c{{0.95f, a}, {0.94f, a}, {0.93f, a}, {0.80f, b}};

    const auto picked = mmr_rerank(c, 2, 0.5f);
    REQUIRE(picked.size() == 2);
    REQUIRE(picked[0] == 0);
    REQUIRE(picked[1] == 3);
}

TEST_CASE("Selection size and uniqueness", "[mmr]") {
    const auto e = facet_test_helpers::random_units(12, 16, 7);
    std::vector<MmrCandidate> c;
    for (std::size_t i = 0; i < e.size(); ++i) c.push_back({static_cast<float>(i % 5) * 0.1f, e[i]});

    for (std::size_t k : {0u, 1u, 5u, 11u}) {
        const auto picked = mmr_rerank(c, k, 0.3f);
        REQUIRE(picked.size() == k);
        REQUIRE(std::set<std::size_t>(picked.begin(), picked.end()).size() == k);
    }

    SECTION("few candidates keep input order") {
        std::vector<MmrCandidate> few{{0.1f, e[0]}, {0.9f, e[1]}};
        REQUIRE(mmr_rerank(few, 5, 0.5f) == std::vector<std::size_t>{0, 1});
    }
    SECTION("missing embeddings count as dissimilar") {
        std::vector<MmrCandidate> bare{{0.5f, {}}, {0.5f, {}}, {0.4f, {}}};
        REQUIRE(mmr_rerank(bare, 2, 1.0f) == std::vector<std::size_t>{0, 1});
    }
}
