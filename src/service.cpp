#include "facet/service.hpp"

#include <iostream>
#include <utility>

#include "facet/core/platform_utils.hpp"

namespace facet {

class Service::Impl {
public:
    Impl(ServiceConfig config, std::shared_ptr<const embedding::Embedder> embedder,
         index::PoolRegistry::Loader loader)
        : config_(std::move(config)),
          embedder_(std::move(embedder)),
          registry_(std::move(loader)),
          profiles_(personalization::ProfileStoreOptions{config_.profile_dir, config_.preferences}, embedder_),
          recommender_(registry_, &profiles_, &collaborative_,
                       scoring::CombinationScorer(config_.image_weights, config_.text_weights),
                       config_.recommender) {}

    auto check_top_k(std::size_t top_k) const -> std::expected<void, core::error> {
        if (top_k == 0 || top_k > config_.max_top_k) {
            return std::unexpected(core::error{core::error_code::invalid_query,
                "top_k must be in [1, " + std::to_string(config_.max_top_k) + "]", "service"});
        }
        return {};
    }

    ServiceConfig config_;
    std::shared_ptr<const embedding::Embedder> embedder_;
    index::PoolRegistry registry_;
    personalization::UserProfileStore profiles_;
    personalization::CollaborativeFilter collaborative_;
    search::Recommender recommender_;
};

Service::Service(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
Service::Service(Service&&) noexcept = default;
Service& Service::operator=(Service&&) noexcept = default;
Service::~Service() = default;

auto Service::open(ServiceConfig config, std::shared_ptr<const embedding::Embedder> embedder,
                   index::PoolRegistry::Loader loader) -> std::expected<Service, core::error> {
    if (auto ok = validate(config); !ok) return std::unexpected(ok.error());
    if (!loader) loader = index::PoolRegistry::file_loader(config.data_dir, config.pool);

    auto impl = std::make_unique<Impl>(std::move(config), std::move(embedder), std::move(loader));
    auto loaded = impl->profiles_.load_all();
    if (!loaded) return std::unexpected(loaded.error());
    impl->collaborative_.rebuild_from(impl->profiles_);
    if (core::debug_enabled()) {
        std::cerr << "[SERVICE][open] data=" << impl->config_.data_dir.string()
                  << " profiles=" << *loaded
                  << " cf_users=" << impl->collaborative_.user_count() << std::endl;
    }
    return Service(std::move(impl));
}

auto Service::search(dataset kind, std::span<const float> query, std::size_t top_k,
                     const filter_criteria* filters) const -> std::expected<SearchResult, core::error> {
    if (query.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_query, "Empty query vector", "service"});
    }
    if (auto ok = impl_->check_top_k(top_k); !ok) return std::unexpected(ok.error());
    auto pool = impl_->registry_.get(kind);
    if (!pool) return std::unexpected(pool.error());
    auto hits = (*pool)->search(query, top_k, filters);
    if (!hits) return std::unexpected(hits.error());

    SearchResult out;
    out.hits.reserve(hits->size());
    for (const auto& h : *hits) out.hits.push_back(SearchHit{h.item->id, h.score, h.item});
    out.pool = std::move(*pool);
    return out;
}

auto Service::search(std::string_view dataset_name, std::span<const float> query, std::size_t top_k,
                     const raw_filters& filters) const -> std::expected<SearchResult, core::error> {
    auto kind = parse_dataset(dataset_name);
    if (!kind) return std::unexpected(kind.error());
    auto criteria = filter_criteria::parse(*kind, filters);
    if (!criteria) return std::unexpected(criteria.error());
    return search(*kind, query, top_k, criteria->empty() ? nullptr : &*criteria);
}

auto Service::recommend_combinations(const search::RecommendRequest& request) const
    -> std::expected<search::RecommendResponse, core::error> {
    if (auto ok = impl_->check_top_k(request.top_k); !ok) return std::unexpected(ok.error());
    if (request.diamond_filters && request.diamond_filters->kind() != dataset::diamonds) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "Diamond filters were built for another dataset", "service"});
    }
    if (request.setting_filters && request.setting_filters->kind() != dataset::settings) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "Setting filters were built for another dataset", "service"});
    }
    return impl_->recommender_.recommend(request);
}

auto Service::embed_query(std::optional<std::string_view> text,
                          std::optional<std::span<const std::uint8_t>> image) const
    -> std::expected<std::vector<float>, core::error> {
    if (!impl_->embedder_) {
        return std::unexpected(core::error{core::error_code::unavailable, "No embedder configured", "service"});
    }
    return embedding::embed_query(*impl_->embedder_, text, image);
}

auto Service::update_preferences(std::string_view user_id, const personalization::PreferenceMap& prefs)
    -> std::expected<void, core::error> {
    return impl_->profiles_.update_preferences(user_id, prefs);
}

auto Service::log_interaction(std::string_view user_id, std::vector<float> item_embedding,
                              personalization::interaction_type type,
                              std::optional<float> weight,
                              std::optional<double> timestamp,
                              std::optional<std::string> item_id) -> std::expected<void, core::error> {
    personalization::InteractionEvent e;
    e.embedding = std::move(item_embedding);
    e.type = type;
    e.weight = weight.value_or(personalization::default_weight(type));
    e.timestamp = timestamp.value_or(personalization::now_seconds());
    e.item_id = std::move(item_id);

    const auto ts = e.timestamp;
    const auto id = e.item_id;
    auto logged = impl_->profiles_.log_interaction(user_id, std::move(e));
    if (!logged) return logged;
    if (id) impl_->collaborative_.record(user_id, *id, type, ts);
    return {};
}

auto Service::log_item_interaction(std::string_view user_id, dataset kind, std::string_view item_id,
                                   personalization::interaction_type type) -> std::expected<void, core::error> {
    auto pool = impl_->registry_.get(kind);
    if (!pool) return std::unexpected(pool.error());
    auto emb = (*pool)->embedding(item_id);
    if (!emb) return std::unexpected(emb.error());
    return log_interaction(user_id, std::vector<float>(emb->begin(), emb->end()), type,
                           std::nullopt, std::nullopt, qualified_id(kind, item_id));
}

auto Service::stats() const -> ServiceStats {
    ServiceStats s;
    for (auto kind : {dataset::diamonds, dataset::settings, dataset::cartier}) {
        if (auto p = impl_->registry_.peek(kind)) s.pools.push_back(p->stats());
    }
    s.pool_builds = impl_->registry_.builds();
    s.users = impl_->profiles_.size();
    s.collaborative_users = impl_->collaborative_.user_count();
    s.collaborative_items = impl_->collaborative_.item_count();
    return s;
}

auto Service::config() const noexcept -> const ServiceConfig& { return impl_->config_; }
auto Service::pools() noexcept -> index::PoolRegistry& { return impl_->registry_; }
auto Service::profiles() const noexcept -> const personalization::UserProfileStore& { return impl_->profiles_; }
auto Service::collaborative() const noexcept -> const personalization::CollaborativeFilter& {
    return impl_->collaborative_;
}

} // namespace facet
