#pragma once

/** \file pool_registry.hpp
 *  \brief Lazily built, shared, read-only pools keyed by dataset.
 *
 * get() is an atomic get-or-create: the fast path is a lock-free acquire load
 * of the published pool; on a miss a single mutex is taken and presence is
 * re-checked, so exactly one build runs per dataset under concurrent first
 * access. A failed build publishes nothing and returns the error; the next
 * get() tries again.
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>

#include "facet/dataset.hpp"
#include "facet/error.hpp"
#include "facet/index/pool.hpp"

namespace facet::index {

class PoolRegistry {
public:
    using Loader = std::function<std::expected<Pool, core::error>(dataset)>;

    explicit PoolRegistry(Loader loader);

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    /** \brief Published pool for \p kind, building it on first use. */
    auto get(dataset kind) -> std::expected<std::shared_ptr<const Pool>, core::error>;

    /** \brief Publish an already built pool (replaces any existing one). */
    auto put(Pool pool) -> std::shared_ptr<const Pool>;

    /** \brief Pool if already published, without building. */
    auto peek(dataset kind) const noexcept -> std::shared_ptr<const Pool>;

    /** \brief Number of loader invocations so far. */
    auto builds() const noexcept -> std::uint64_t;

    /** \brief Loader reading "<dir>/<dataset>_metadata.bin" and
     *  "<dir>/<dataset>_embeddings.npy" (falls back to ".bin").
     */
    static auto file_loader(std::filesystem::path dir, PoolBuildConfig config) -> Loader;

private:
    static constexpr std::size_t kSlots = 3;

    struct Slot {
        std::atomic<std::shared_ptr<const Pool>> pool;
        std::mutex build_mutex;
    };

    Loader loader_;
    std::array<Slot, kSlots> slots_;
    std::atomic<std::uint64_t> builds_{0};
};

} // namespace facet::index
