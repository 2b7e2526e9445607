#include "facet/config.hpp"

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>
#include <system_error>

#include "facet/core/platform_utils.hpp"

namespace facet {

namespace {

inline std::optional<std::string> getenv_nonempty(const char* key) {
    auto v = core::safe_getenv(key);
    if (v && !v->empty()) return v;
    return std::nullopt;
}

auto invalid(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::config_invalid, std::move(message), "config"});
}

template <class T>
auto parse_number(const char* key, const std::string& text) -> std::expected<T, core::error> {
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return invalid(std::string(key) + " is not a valid number: '" + text + "'");
    }
    return value;
}

template <class T>
auto override_number(const char* key, T& field) -> std::expected<void, core::error> {
    auto v = getenv_nonempty(key);
    if (!v) return {};
    auto parsed = parse_number<T>(key, *v);
    if (!parsed) return std::unexpected(parsed.error());
    field = *parsed;
    return {};
}

auto weights_ok(const scoring::ScoringWeights& w) -> bool {
    for (float x : {w.similarity, w.attribute, w.compatibility, w.user}) {
        if (!std::isfinite(x) || x < 0.0f) return false;
    }
    return true;
}

} // namespace

auto config_from_env(ServiceConfig base) -> std::expected<ServiceConfig, core::error> {
    if (auto v = getenv_nonempty("FACET_DATA_DIR")) base.data_dir = *v;
    if (auto v = getenv_nonempty("FACET_PROFILE_DIR")) base.profile_dir = std::filesystem::path(*v);

    std::expected<void, core::error> r;
    if (!(r = override_number("FACET_FLAT_THRESHOLD", base.pool.flat_threshold))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_HNSW_M", base.pool.hnsw.M))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_HNSW_EF_CONSTRUCTION", base.pool.hnsw.efConstruction))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_HNSW_EF_SEARCH", base.pool.ef_search))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_HALF_LIFE_DAYS", base.preferences.half_life_days))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_DIVERSITY_WEIGHT", base.recommender.diversity_weight))) return std::unexpected(r.error());
    if (!(r = override_number("FACET_MAX_CANDIDATES", base.recommender.max_candidates))) return std::unexpected(r.error());
    return base;
}

auto validate(const ServiceConfig& c) -> std::expected<void, core::error> {
    if (c.pool.hnsw.M < 2) return invalid("pool.hnsw.M must be at least 2");
    if (c.pool.hnsw.efConstruction < c.pool.hnsw.M) return invalid("pool.hnsw.efConstruction must be >= M");
    if (c.pool.ef_search == 0) return invalid("pool.ef_search must be positive");
    if (!(c.preferences.half_life_days > 0.0) || !std::isfinite(c.preferences.half_life_days)) {
        return invalid("preferences.half_life_days must be positive");
    }
    if (c.preferences.max_interactions == 0) return invalid("preferences.max_interactions must be positive");
    if (c.preferences.base_weight < 0.0f || c.preferences.interaction_weight < 0.0f) {
        return invalid("preferences weights must be non-negative");
    }
    if (!std::isfinite(c.recommender.diversity_weight) || c.recommender.diversity_weight < 0.0f) {
        return invalid("recommender.diversity_weight must be finite and non-negative");
    }
    if (c.recommender.max_candidates == 0) return invalid("recommender.max_candidates must be positive");
    if (!weights_ok(c.image_weights) || !weights_ok(c.text_weights)) {
        return invalid("scoring weights must be finite and non-negative");
    }
    if (c.max_top_k == 0) return invalid("max_top_k must be positive");
    return {};
}

} // namespace facet
