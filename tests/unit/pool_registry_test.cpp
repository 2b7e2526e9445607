/** \file pool_registry_test.cpp
 *  \brief Lazy pool publication and file loading.
 */

#include <catch2/catch_test_macros.hpp>

#include "facet/index/pool_registry.hpp"
#include "facet_test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace facet;
using namespace facet::index;
using facet_test_helpers::make_item;

namespace {

Pool small_pool(dataset kind) {
    return facet_test_helpers::make_pool(kind, facet_test_helpers::random_units(3, 8, 11),
                                         {make_item("a"), make_item("b"), make_item("c")});
}

} // namespace

TEST_CASE("Concurrent first access builds a pool once", "[registry][concurrency]") {
    std::atomic<int> calls{0};
    PoolRegistry registry([&](dataset kind) -> std::expected<Pool, core::error> {
        calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return small_pool(kind);
    });

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<const Pool>> seen(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto p = registry.get(dataset::diamonds);
            if (p) seen[static_cast<std::size_t>(t)] = *p;
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(calls.load() == 1);
    REQUIRE(registry.builds() == 1);
    for (const auto& p : seen) {
        REQUIRE(p != nullptr);
        REQUIRE(p.get() == seen[0].get());
    }
    REQUIRE(registry.peek(dataset::settings) == nullptr);
}

TEST_CASE("A failed build is retried on the next access", "[registry]") {
    int calls = 0;
    PoolRegistry registry([&](dataset kind) -> std::expected<Pool, core::error> {
        if (++calls == 1) {
            return std::unexpected(core::error{core::error_code::io_failed, "disk gone", "test"});
        }
        return small_pool(kind);
    });

    auto first = registry.get(dataset::settings);
    REQUIRE_FALSE(first.has_value());
    REQUIRE(first.error().code == core::error_code::io_failed);
    REQUIRE(registry.peek(dataset::settings) == nullptr);

    auto second = registry.get(dataset::settings);
    REQUIRE(second.has_value());
    REQUIRE((*second)->size() == 3);
    REQUIRE(calls == 2);
}

TEST_CASE("A loader returning the wrong dataset is rejected", "[registry]") {
    PoolRegistry registry([](dataset) -> std::expected<Pool, core::error> { return small_pool(dataset::cartier); });
    auto p = registry.get(dataset::diamonds);
    REQUIRE_FALSE(p.has_value());
    REQUIRE(p.error().code == core::error_code::data_integrity);
}

TEST_CASE("put publishes without invoking the loader", "[registry]") {
    PoolRegistry registry(PoolRegistry::Loader{});
    REQUIRE_FALSE(registry.get(dataset::diamonds).has_value());

    auto published = registry.put(small_pool(dataset::diamonds));
    auto got = registry.get(dataset::diamonds);
    REQUIRE(got.has_value());
    REQUIRE(got->get() == published.get());
    REQUIRE(registry.builds() == 0);
}

TEST_CASE("file_loader reads metadata and npy embeddings from a directory", "[registry][io]") {
    facet_test_helpers::TempDir dir("registry");
    std::vector<metadata::Item> items{make_item("r1", {{"price", 5000.0}}), make_item("r2", {{"price", 7000.0}})};
    REQUIRE(metadata::save_items(dir.path() / "cartier_metadata.bin", items).has_value());
    auto m = make_matrix(facet_test_helpers::random_units(2, 4, 3));
    REQUIRE(m.has_value());
    REQUIRE(save_npy(dir.path() / "cartier_embeddings.npy", *m).has_value());

    PoolRegistry registry(PoolRegistry::file_loader(dir.path(), PoolBuildConfig{}));
    auto pool = registry.get(dataset::cartier);
    REQUIRE(pool.has_value());
    REQUIRE((*pool)->size() == 2);
    REQUIRE((*pool)->item(1).id == "r2");

    auto missing = registry.get(dataset::diamonds);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == core::error_code::io_failed);
}
