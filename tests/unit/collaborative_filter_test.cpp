/** \file collaborative_filter_test.cpp
 *  \brief Similarity measures and the recommendation fallback chain.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "facet/personalization/collaborative_filter.hpp"
#include "facet/personalization/profile_store.hpp"
#include "facet_test_helpers.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace facet;
using namespace facet::personalization;
using Catch::Matchers::WithinAbs;

namespace {

bool contains(const std::vector<ScoredId>& v, std::string_view id) {
    return std::any_of(v.begin(), v.end(), [&](const ScoredId& s) { return s.first == id; });
}

} // namespace

TEST_CASE("top_scored orders by score then id", "[cf]") {
    auto v = top_scored({{"b", 0.5f}, {"a", 0.5f}, {"c", 0.9f}, {"d", 0.1f}}, 3);
    REQUIRE(v.size() == 3);
    REQUIRE(v[0].first == "c");
    REQUIRE(v[1].first == "a");
    REQUIRE(v[2].first == "b");
    REQUIRE(top_scored({{"x", 1.0f}}, 5).size() == 1);
}

TEST_CASE("Interaction similarities use Jaccard overlap", "[cf][jaccard]") {
    CollaborativeFilter cf;
    cf.record("u1", "settings:1", interaction_type::click, 0.0);
    cf.record("u1", "settings:2", interaction_type::like, 0.0);
    cf.record("u2", "settings:2", interaction_type::click, 0.0);
    cf.record("u2", "settings:3", interaction_type::click, 0.0);
    cf.record("u3", "diamonds:9", interaction_type::click, 0.0);

    REQUIRE(cf.user_count() == 3);
    REQUIRE(cf.item_count() == 4);

    auto users = cf.user_similarity_by_interactions("u1", 5);
    REQUIRE(users.size() == 2);
    REQUIRE(users[0].first == "u2");
    REQUIRE_THAT(users[0].second, WithinAbs(1.0 / 3.0, 1e-6));
    REQUIRE_THAT(users[1].second, WithinAbs(0.0, 1e-6));

    auto items = cf.item_similarity_by_interactions("settings:2", 5);
    REQUIRE(items[0].second > 0.0f);
    REQUIRE(cf.user_similarity_by_interactions("nobody", 5).empty());
}

TEST_CASE("Vector similarities exclude the key itself", "[cf][vectors]") {
    CollaborativeFilter cf;
    VectorMap vectors{{"a", facet_test_helpers::axis(3, 0)},
                      {"b", facet_test_helpers::blend(facet_test_helpers::axis(3, 0), 1.0f,
                                                      facet_test_helpers::axis(3, 1), 1.0f)},
                      {"c", facet_test_helpers::axis(3, 2)}};
    auto top = cf.user_similarity("a", vectors, 5);
    REQUIRE(top.size() == 2);
    REQUIRE(top[0].first == "b");
    REQUIRE_FALSE(contains(top, "a"));
    REQUIRE(cf.item_similarity("zzz", vectors, 5).empty());
}

TEST_CASE("Recommendation falls back in a fixed order", "[cf][recommend]") {
    CollaborativeFilter cf;
    const VectorMap no_vectors;
    VectorMap items{{"settings:1", facet_test_helpers::axis(3, 0)},
                    {"settings:2", facet_test_helpers::axis(3, 1)},
                    {"settings:3", facet_test_helpers::blend(facet_test_helpers::axis(3, 0), 1.0f,
                                                             facet_test_helpers::axis(3, 2), 1.0f)}};

    SECTION("similar users by preference vector") {
        cf.record("friend", "settings:2", interaction_type::purchase, 0.0);
        cf.record("stranger", "settings:1", interaction_type::purchase, 0.0);
        VectorMap users{{"me", facet_test_helpers::axis(3, 0)},
                        {"friend", facet_test_helpers::axis(3, 0)},
                        {"stranger", facet_test_helpers::axis(3, 1)}};
        auto r = cf.recommend("me", users, items, std::nullopt, 5);
        REQUIRE(r.strategy == cf_strategy::similar_users);
        REQUIRE(r.items[0].first == "settings:2");
        REQUIRE_THAT(r.items[0].second, WithinAbs(5.0, 1e-5));
        REQUIRE(to_string(r.strategy) == "similar_users");
    }
    SECTION("similar users by shared interactions") {
        cf.record("me", "settings:1", interaction_type::click, 0.0);
        cf.record("peer", "settings:1", interaction_type::click, 0.0);
        cf.record("peer", "settings:3", interaction_type::like, 0.0);
        auto r = cf.recommend("me", no_vectors, items, std::nullopt, 5);
        REQUIRE(r.strategy == cf_strategy::similar_users);
        REQUIRE(contains(r.items, "settings:3"));
    }
    SECTION("item expansion when no neighbour overlaps") {
        cf.record("me", "settings:1", interaction_type::like, 0.0);
        cf.record("other", "diamonds:5", interaction_type::click, 0.0);
        auto r = cf.recommend("me", no_vectors, items, std::nullopt, 5);
        REQUIRE(r.strategy == cf_strategy::item_based);
        REQUIRE(r.items[0].first == "settings:3");
        REQUIRE_FALSE(contains(r.items, "settings:1"));
    }
    SECTION("content cold start for a new user") {
        const auto q = facet_test_helpers::axis(3, 1);
        auto r = cf.recommend("new", no_vectors, items, std::span<const float>(q), 2);
        REQUIRE(r.strategy == cf_strategy::cold_start);
        REQUIRE(r.items.size() == 2);
        REQUIRE(r.items[0].first == "settings:2");
    }
    SECTION("nothing to go on") {
        auto r = cf.recommend("new", no_vectors, items, std::nullopt, 5);
        REQUIRE(r.strategy == cf_strategy::none);
        REQUIRE(r.items.empty());
    }
}

TEST_CASE("Rebuild indexes only interactions with item ids", "[cf][rebuild]") {
    UserProfileStore store(ProfileStoreOptions{});
    InteractionEvent with_id;
    with_id.embedding = facet_test_helpers::axis(3, 0);
    with_id.item_id = "diamonds:1";
    InteractionEvent anonymous;
    anonymous.embedding = facet_test_helpers::axis(3, 1);
    REQUIRE(store.log_interaction("u1", with_id).has_value());
    REQUIRE(store.log_interaction("u2", anonymous).has_value());

    CollaborativeFilter cf;
    cf.record("stale", "settings:4", interaction_type::click, 0.0);
    cf.rebuild_from(store);
    REQUIRE(cf.user_count() == 1);
    REQUIRE(cf.item_count() == 1);
    REQUIRE(cf.item_similarity_by_interactions("settings:4", 5).empty());
}
