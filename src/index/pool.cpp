/** \file pool.cpp
 *  \brief Pool construction, validation and search.
 */

#include "facet/index/pool.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>

#include "facet/core/platform_utils.hpp"
#include "facet/filter_eval.hpp"
#include "facet/index/flat_index.hpp"
#include "facet/kernels/distance.hpp"

namespace facet::index {

class Pool::Impl {
public:
    dataset kind_{dataset::diamonds};
    PoolBuildConfig config_;
    EmbeddingMatrix embeddings_;
    std::vector<metadata::Item> items_;
    std::unordered_map<std::string, std::uint32_t> id_to_pos_;
    IndexType type_{IndexType::Flat};
    HnswIndex hnsw_;
    std::size_t renormalized_{0};

    auto validate_and_normalize() -> std::expected<void, core::error>;
    auto build_index() -> std::expected<void, core::error>;
};

auto Pool::Impl::validate_and_normalize() -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;

    if (embeddings_.rows != items_.size()) {
        return std::unexpected(error{error_code::data_integrity,
            "Embedding/metadata count mismatch: " + std::to_string(embeddings_.rows) +
            " rows vs " + std::to_string(items_.size()) + " items",
            "pool.build"});
    }
    if (embeddings_.dim != 0 &&
        embeddings_.rows > std::numeric_limits<std::size_t>::max() / embeddings_.dim) {
        return std::unexpected(error{error_code::data_integrity, "Embedding shape overflows", "pool.build"});
    }
    if (embeddings_.data.size() != embeddings_.rows * embeddings_.dim) {
        return std::unexpected(error{error_code::data_integrity, "Embedding payload size mismatch", "pool.build"});
    }
    if (items_.size() > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(error{error_code::data_integrity, "Pool exceeds 32-bit positions", "pool.build"});
    }
    if (embeddings_.rows > 0 && embeddings_.dim == 0) {
        return std::unexpected(error{error_code::data_integrity, "Zero-dimensional embeddings", "pool.build"});
    }

    id_to_pos_.reserve(items_.size());
    for (std::size_t i = 0; i < items_.size(); ++i) {
        auto [it, inserted] = id_to_pos_.emplace(items_[i].id, static_cast<std::uint32_t>(i));
        if (!inserted) {
            return std::unexpected(error{error_code::data_integrity,
                "Duplicate item id '" + items_[i].id + "'", "pool.build"});
        }
        auto row = embeddings_.row(i);
        const float norm = kernels::l2_norm(row);
        if (!(norm > 0.0f) || !std::isfinite(norm)) {
            return std::unexpected(error{error_code::data_integrity,
                "Zero or non-finite embedding at row " + std::to_string(i), "pool.build"});
        }
        if (std::fabs(norm - 1.0f) > config_.norm_tolerance) ++renormalized_;
        (void)kernels::normalize(row);
    }
    return {};
}

auto Pool::Impl::build_index() -> std::expected<void, core::error> {
    if (config_.strategy == SelectionStrategy::Manual) {
        type_ = config_.manual_type;
    } else {
        type_ = items_.size() < config_.flat_threshold ? IndexType::Flat : IndexType::Hnsw;
    }
    if (type_ == IndexType::Flat || items_.empty()) return {};

    if (auto r = hnsw_.init(embeddings_.dim, config_.hnsw, embeddings_.rows); !r) {
        return std::unexpected(r.error());
    }
    for (std::size_t i = 0; i < embeddings_.rows; ++i) {
        if (auto r = hnsw_.add(embeddings_.row(i)); !r) return std::unexpected(r.error());
    }
    return {};
}

Pool::Pool(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Pool::Pool(Pool&&) noexcept = default;
Pool& Pool::operator=(Pool&&) noexcept = default;
Pool::~Pool() = default;

auto Pool::build(dataset kind, EmbeddingMatrix embeddings, std::vector<metadata::Item> items,
                 const PoolBuildConfig& config)
    -> std::expected<Pool, core::error> {
    auto impl = std::make_unique<Impl>();
    impl->kind_ = kind;
    impl->config_ = config;
    impl->embeddings_ = std::move(embeddings);
    impl->items_ = std::move(items);

    if (auto r = impl->validate_and_normalize(); !r) return std::unexpected(r.error());
    if (auto r = impl->build_index(); !r) return std::unexpected(r.error());

    if (core::debug_enabled()) {
        std::cerr << "[POOL][build] dataset=" << to_string(kind)
                  << " items=" << impl->items_.size()
                  << " dim=" << impl->embeddings_.dim
                  << " index=" << (impl->type_ == IndexType::Flat ? "flat" : "hnsw")
                  << " renormalized=" << impl->renormalized_ << std::endl;
    }
    return Pool(std::move(impl));
}

auto Pool::load(dataset kind, const std::filesystem::path& metadata_path,
                const std::filesystem::path& embeddings_path, const PoolBuildConfig& config)
    -> std::expected<Pool, core::error> {
    auto items = metadata::load_items(metadata_path);
    if (!items) return std::unexpected(items.error());
    auto emb = load_embeddings(embeddings_path);
    if (!emb) return std::unexpected(emb.error());
    if (core::debug_enabled()) {
        std::cerr << "[POOL][load] " << metadata_path.string() << " + " << embeddings_path.string() << std::endl;
    }
    return build(kind, std::move(*emb), std::move(*items), config);
}

auto Pool::search(std::span<const float> query, std::size_t k, const filter_criteria* filters) const
    -> std::expected<std::vector<PoolHit>, core::error> {
    using core::error;
    using core::error_code;

    const auto& I = *impl_;
    if (query.size() != I.embeddings_.dim) {
        return std::unexpected(error{error_code::invalid_argument,
            "Query dimension " + std::to_string(query.size()) + " != pool dimension " +
            std::to_string(I.embeddings_.dim), "pool.search"});
    }
    if (filters && filters->kind() != I.kind_) {
        return std::unexpected(error{error_code::invalid_argument,
            "Filter for " + std::string(to_string(filters->kind())) + " applied to " +
            std::string(to_string(I.kind_)), "pool.search"});
    }

    std::vector<ScoredRow> rows;
    if (filters && !filters->empty()) {
        const auto eligible = filter_eval::eligible(*filters, I.items_);
        rows = flat_search(I.embeddings_, query, k, &eligible);
    } else if (I.type_ == IndexType::Hnsw && !I.items_.empty()) {
        HnswSearchParams sp;
        sp.k = static_cast<std::uint32_t>(std::min<std::size_t>(k, I.items_.size()));
        sp.efSearch = I.config_.ef_search;
        auto found = I.hnsw_.search(query, sp);
        if (!found) return std::unexpected(found.error());
        rows.reserve(found->size());
        for (const auto& [pos, score] : *found) rows.push_back({pos, score});
        std::sort(rows.begin(), rows.end(), ranks_before);
    } else {
        rows = flat_search(I.embeddings_, query, k);
    }

    std::vector<PoolHit> hits;
    hits.reserve(rows.size());
    for (const auto& r : rows) hits.push_back({r.position, r.score, &I.items_[r.position]});
    return hits;
}

auto Pool::embedding(std::string_view id) const -> std::expected<std::span<const float>, core::error> {
    const auto pos = position_of(id);
    if (!pos) {
        return std::unexpected(core::error{core::error_code::not_found,
            "No item '" + std::string(id) + "' in " + std::string(to_string(impl_->kind_)),
            "pool.embedding"});
    }
    return impl_->embeddings_.row(*pos);
}

auto Pool::position_of(std::string_view id) const -> std::optional<std::uint32_t> {
    auto it = impl_->id_to_pos_.find(std::string(id));
    if (it == impl_->id_to_pos_.end()) return std::nullopt;
    return it->second;
}

auto Pool::embedding_at(std::uint32_t position) const noexcept -> std::span<const float> {
    return impl_->embeddings_.row(position);
}

auto Pool::item(std::uint32_t position) const noexcept -> const metadata::Item& {
    return impl_->items_[position];
}

auto Pool::items() const noexcept -> std::span<const metadata::Item> { return impl_->items_; }
auto Pool::kind() const noexcept -> dataset { return impl_->kind_; }
auto Pool::size() const noexcept -> std::size_t { return impl_->items_.size(); }
auto Pool::dimension() const noexcept -> std::size_t { return impl_->embeddings_.dim; }
auto Pool::index_type() const noexcept -> IndexType { return impl_->type_; }

auto Pool::stats() const noexcept -> PoolStats {
    PoolStats s{impl_->kind_, impl_->items_.size(), impl_->embeddings_.dim,
                impl_->type_, impl_->renormalized_, std::nullopt};
    if (impl_->type_ == IndexType::Hnsw) s.graph = impl_->hnsw_.get_stats();
    return s;
}

} // namespace facet::index
