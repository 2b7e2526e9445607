/** \file profile_store_test.cpp
 *  \brief Profile store mutations, persistence and concurrency.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "facet/kernels/distance.hpp"
#include "facet/personalization/profile_store.hpp"
#include "facet_test_helpers.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace facet;
using namespace facet::personalization;
using Catch::Matchers::WithinAbs;

namespace {

InteractionEvent click(std::vector<float> e, std::optional<std::string> item = std::nullopt) {
    InteractionEvent ev;
    ev.embedding = std::move(e);
    ev.type = interaction_type::click;
    ev.weight = 1.0f;
    ev.timestamp = now_seconds();
    ev.item_id = std::move(item);
    return ev;
}

} // namespace

TEST_CASE("Profile file names escape unsafe characters", "[profile_store][io]") {
    REQUIRE(profile_file_name("alice") == "alice.profile");
    REQUIRE(profile_file_name("a/b c") == "a%2Fb%20c.profile");
    REQUIRE(profile_file_name("..") == "%2E..profile");
}

TEST_CASE("Preferences are embedded and stored normalized", "[profile_store][preferences]") {
    auto embedder = std::make_shared<facet_test_helpers::FakeEmbedder>(4);
    embedder->set_text("prefers platinum", {3.0f, 0.0f, 4.0f, 0.0f});
    UserProfileStore store(ProfileStoreOptions{}, embedder);

    PreferenceMap prefs;
    prefs.metal = "platinum";
    REQUIRE(store.update_preferences("u1", prefs).has_value());

    auto p = store.get("u1");
    REQUIRE(p.has_value());
    REQUIRE(p->preference_text == "prefers platinum");
    REQUIRE_THAT((*p->preference)[0], WithinAbs(0.6, 1e-6));
    REQUIRE_THAT((*p->preference)[2], WithinAbs(0.8, 1e-6));
    REQUIRE(store.size() == 1);

    SECTION("empty user id") {
        auto r = store.update_preferences("", prefs);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::invalid_argument);
    }
    SECTION("embedder failure leaves the profile unchanged") {
        embedder->fail_text("prefers gold");
        PreferenceMap gold;
        gold.metal = "gold";
        auto r = store.update_preferences("u1", gold);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
        REQUIRE(store.get("u1")->preference_text == "prefers platinum");
    }
    SECTION("no embedder") {
        UserProfileStore bare(ProfileStoreOptions{});
        auto r = bare.update_preferences("u1", prefs);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::unavailable);
    }
}

TEST_CASE("Interactions are validated and normalized", "[profile_store][interaction]") {
    UserProfileStore store(ProfileStoreOptions{});

    REQUIRE_FALSE(store.log_interaction("u", click({})).has_value());
    REQUIRE_FALSE(store.log_interaction("u", click({0.0f, 0.0f})).has_value());
    REQUIRE_FALSE(store.log_interaction("u", click({NAN, 1.0f})).has_value());
    REQUIRE_FALSE(store.get("u").has_value());

    REQUIRE(store.log_interaction("u", click({0.0f, 2.0f}, "settings:9")).has_value());
    auto p = store.get("u");
    REQUIRE(p.has_value());
    REQUIRE(p->interactions.size() == 1);
    REQUIRE_THAT(p->interactions[0].embedding[1], WithinAbs(1.0, 1e-6));
    REQUIRE(p->interactions[0].item_id == "settings:9");

    auto mismatch = store.log_interaction("u", click({1.0f, 0.0f, 0.0f}));
    REQUIRE_FALSE(mismatch.has_value());
    REQUIRE(mismatch.error().code == core::error_code::invalid_argument);

    auto v = store.user_vector("u");
    REQUIRE(v.has_value());
    REQUIRE_THAT((*v)[1], WithinAbs(1.0, 1e-6));
    REQUIRE_FALSE(store.user_vector("nobody").has_value());
}

TEST_CASE("Concurrent logging for one user loses no updates", "[profile_store][concurrency]") {
    ProfileStoreOptions opts;
    opts.model.max_interactions = 1000;
    opts.stripes = 4;
    UserProfileStore store(opts);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto seed = static_cast<std::uint32_t>(t * 1000 + i);
                (void)store.log_interaction("shared", click(facet_test_helpers::random_unit(8, seed)));
                (void)store.log_interaction("user-" + std::to_string(t), click(facet_test_helpers::random_unit(8, seed)));
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(store.get("shared")->interactions.size() == kThreads * kPerThread);
    for (int t = 0; t < kThreads; ++t) {
        REQUIRE(store.get("user-" + std::to_string(t))->interactions.size() == kPerThread);
    }
    REQUIRE(store.size() == kThreads + 1);
    REQUIRE(store.all_vectors().size() == kThreads + 1);
}

TEST_CASE("Profiles persist and reload", "[profile_store][io]") {
    facet_test_helpers::TempDir dir("profiles");
    auto embedder = std::make_shared<facet_test_helpers::FakeEmbedder>(4);
    ProfileStoreOptions opts;
    opts.directory = dir.path();

    {
        UserProfileStore store(opts, embedder);
        PreferenceMap prefs;
        prefs.style = "halo";
        REQUIRE(store.update_preferences("carol@example.com", prefs).has_value());
        auto ev = click(facet_test_helpers::axis(4, 3), "diamonds:7");
        ev.type = interaction_type::purchase;
        ev.weight = 5.0f;
        REQUIRE(store.log_interaction("carol@example.com", ev).has_value());
        REQUIRE(store.log_interaction("dave", click(facet_test_helpers::axis(4, 0))).has_value());
    }
    REQUIRE(std::filesystem::exists(dir.path() / profile_file_name("carol@example.com")));

    UserProfileStore reloaded(opts, embedder);
    auto n = reloaded.load_all();
    REQUIRE(n.has_value());
    REQUIRE(*n == 2);

    auto carol = reloaded.get("carol@example.com");
    REQUIRE(carol.has_value());
    REQUIRE(carol->preference_text == "prefers halo style");
    REQUIRE(carol->preference.has_value());
    REQUIRE(carol->interactions.size() == 1);
    REQUIRE(carol->interactions[0].type == interaction_type::purchase);
    REQUIRE(carol->interactions[0].weight == 5.0f);
    REQUIRE(carol->interactions[0].item_id == "diamonds:7");

    SECTION("a corrupt document fails the load") {
        std::ofstream(dir.path() / "bad.profile", std::ios::binary) << "garbage";
        auto r = reloaded.load_all();
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::data_integrity);
        // In-memory state is untouched.
        REQUIRE(reloaded.size() == 2);
    }
}

TEST_CASE("Cold users can be seeded from similar users", "[profile_store][seed]") {
    UserProfileStore store(ProfileStoreOptions{});
    REQUIRE(store.log_interaction("a", click(facet_test_helpers::axis(3, 0))).has_value());
    REQUIRE(store.log_interaction("b", click(facet_test_helpers::axis(3, 1))).has_value());

    const std::vector<std::pair<std::string, float>> similar{{"a", 0.9f}, {"b", 0.3f}, {"ghost", 1.0f}, {"b", -1.0f}};
    auto seeded = store.seed_from_similar_users("new", similar);
    REQUIRE(seeded.has_value());
    REQUIRE(seeded->has_value());
    const auto& v = **seeded;
    REQUIRE_THAT(kernels::l2_norm(v), WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(v[0] / v[1], WithinAbs(3.0, 1e-4));
    REQUIRE(store.get("new")->preference.has_value());

    const std::vector<std::pair<std::string, float>> nobody{{"ghost", 1.0f}};
    auto none = store.seed_from_similar_users("other", nobody);
    REQUIRE(none.has_value());
    REQUIRE_FALSE(none->has_value());
    REQUIRE_FALSE(store.get("other").has_value());
}
