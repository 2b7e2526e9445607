#include "facet/index/pool_registry.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "facet/core/platform_utils.hpp"

namespace facet::index {

PoolRegistry::PoolRegistry(Loader loader) : loader_(std::move(loader)) {}

auto PoolRegistry::get(dataset kind) -> std::expected<std::shared_ptr<const Pool>, core::error> {
    auto& slot = slots_[static_cast<std::size_t>(kind)];
    if (auto p = slot.pool.load(std::memory_order_acquire)) return p;

    std::lock_guard<std::mutex> lock(slot.build_mutex);
    if (auto p = slot.pool.load(std::memory_order_acquire)) return p;

    if (!loader_) {
        return std::unexpected(core::error{core::error_code::unavailable,
            "No loader for " + std::string(to_string(kind)), "pool.registry"});
    }
    builds_.fetch_add(1, std::memory_order_relaxed);
    auto built = loader_(kind);
    if (!built) {
        if (core::debug_enabled()) {
            std::cerr << "[REGISTRY] build of " << to_string(kind) << " failed: "
                      << built.error().message << std::endl;
        }
        return std::unexpected(built.error());
    }
    if (built->kind() != kind) {
        return std::unexpected(core::error{core::error_code::data_integrity,
            "Loader returned a " + std::string(to_string(built->kind())) + " pool for " +
            std::string(to_string(kind)), "pool.registry"});
    }
    std::shared_ptr<const Pool> p = std::make_shared<const Pool>(std::move(*built));
    slot.pool.store(p, std::memory_order_release);
    return p;
}

auto PoolRegistry::put(Pool pool) -> std::shared_ptr<const Pool> {
    auto& slot = slots_[static_cast<std::size_t>(pool.kind())];
    std::shared_ptr<const Pool> p = std::make_shared<const Pool>(std::move(pool));
    std::lock_guard<std::mutex> lock(slot.build_mutex);
    slot.pool.store(p, std::memory_order_release);
    return p;
}

auto PoolRegistry::peek(dataset kind) const noexcept -> std::shared_ptr<const Pool> {
    return slots_[static_cast<std::size_t>(kind)].pool.load(std::memory_order_acquire);
}

auto PoolRegistry::builds() const noexcept -> std::uint64_t {
    return builds_.load(std::memory_order_relaxed);
}

auto PoolRegistry::file_loader(std::filesystem::path dir, PoolBuildConfig config) -> Loader {
    return [dir = std::move(dir), config](dataset kind) -> std::expected<Pool, core::error> {
        const std::string stem(to_string(kind));
        const auto meta = dir / (stem + "_metadata.bin");
        auto emb = dir / (stem + "_embeddings.npy");
        std::error_code ec;
        if (!std::filesystem::exists(emb, ec)) emb = dir / (stem + "_embeddings.bin");
        return Pool::load(kind, meta, emb, config);
    };
}

} // namespace facet::index
