#include "facet/personalization/user_profile.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iterator>
#include <sstream>

#include "facet/kernels/distance.hpp"

namespace facet::personalization {

namespace {

constexpr double kSecondsPerDay = 24.0 * 3600.0;

auto format_price(double v) -> std::string {
    std::ostringstream os;
    os.precision(15);
    os << v;
    return os.str();
}

auto present(const std::optional<std::string>& s) -> bool {
    return s && !s->empty();
}

} // namespace

auto parse_interaction_type(std::string_view s) -> std::expected<interaction_type, core::error> {
    std::string l(s);
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "click") return interaction_type::click;
    if (l == "like") return interaction_type::like;
    if (l == "purchase") return interaction_type::purchase;
    return std::unexpected(core::error{core::error_code::invalid_argument,
        "Unknown interaction type '" + std::string(s) + "'", "profile.interaction"});
}

auto to_string(interaction_type t) noexcept -> std::string_view {
    switch (t) {
        case interaction_type::click: return "click";
        case interaction_type::like: return "like";
        case interaction_type::purchase: return "purchase";
    }
    return "click";
}

auto now_seconds() -> double {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

auto decay_factor(double age_days, double half_life_days) noexcept -> double {
    if (age_days <= 0.0 || !(half_life_days > 0.0)) return 1.0;
    return std::clamp(std::exp2(-age_days / half_life_days), 0.0, 1.0);
}

auto decay_weight(const InteractionEvent& e, double now, const PreferenceModelConfig& cfg) noexcept -> double {
    const double age_days = (now - e.timestamp) / kSecondsPerDay;
    return static_cast<double>(e.weight) * decay_factor(age_days, cfg.half_life_days);
}

auto interaction_vector(const UserProfile& p, double now, const PreferenceModelConfig& cfg)
    -> std::optional<std::vector<float>> {
    std::vector<float> acc;
    double total = 0.0;
    for (const auto& e : p.interactions) {
        if (e.embedding.empty()) continue;
        if (acc.empty()) acc.assign(e.embedding.size(), 0.0f);
        if (e.embedding.size() != acc.size()) continue;
        std::vector<float> unit = e.embedding;
        if (!kernels::normalize(unit)) continue;
        const double w = decay_weight(e, now, cfg);
        if (!(w > 0.0)) continue;
        kernels::axpy(static_cast<float>(w), unit, acc);
        total += w;
    }
    if (acc.empty() || !(total > 0.0)) return std::nullopt;
    for (auto& x : acc) x = static_cast<float>(x / total);
    if (!kernels::normalize(acc)) return std::nullopt;
    return acc;
}

auto hybrid_vector(const UserProfile& p, double now, const PreferenceModelConfig& cfg)
    -> std::optional<std::vector<float>> {
    std::optional<std::vector<float>> base;
    if (p.preference && !p.preference->empty()) {
        base = *p.preference;
        if (!kernels::normalize(*base)) base.reset();
    }
    auto inter = interaction_vector(p, now, cfg);
    if (base && inter && base->size() == inter->size()) {
        std::vector<float> out(base->size(), 0.0f);
        kernels::axpy(cfg.base_weight, *base, out);
        kernels::axpy(cfg.interaction_weight, *inter, out);
        if (!kernels::normalize(out)) return base;
        return out;
    }
    if (base) return base;
    return inter;
}

auto is_sparse(const UserProfile& p, const PreferenceModelConfig& cfg) noexcept -> bool {
    return p.interactions.size() < cfg.sparse_threshold;
}

auto recent_trend(const UserProfile& p, std::size_t window) -> std::optional<std::vector<float>> {
    if (p.interactions.empty() || window == 0) return std::nullopt;
    const std::size_t first = p.interactions.size() > window ? p.interactions.size() - window : 0;
    std::vector<float> acc;
    std::size_t used = 0;
    for (std::size_t i = first; i < p.interactions.size(); ++i) {
        const auto& emb = p.interactions[i].embedding;
        if (emb.empty()) continue;
        if (acc.empty()) acc.assign(emb.size(), 0.0f);
        if (emb.size() != acc.size()) continue;
        kernels::axpy(1.0f, emb, acc);
        ++used;
    }
    if (used == 0 || !kernels::normalize(acc)) return std::nullopt;
    return acc;
}

void append_interaction(UserProfile& p, InteractionEvent e, const PreferenceModelConfig& cfg) {
    p.interactions.push_back(std::move(e));
    if (cfg.max_interactions > 0 && p.interactions.size() > cfg.max_interactions) {
        const auto excess = static_cast<std::ptrdiff_t>(p.interactions.size() - cfg.max_interactions);
        p.interactions.erase(p.interactions.begin(), std::next(p.interactions.begin(), excess));
    }
}

auto preference_text(const PreferenceMap& prefs) -> std::string {
    std::vector<std::string> parts;
    if (present(prefs.metal)) parts.push_back("prefers " + *prefs.metal);
    if (present(prefs.style)) parts.push_back("prefers " + *prefs.style + " style");
    if (prefs.price_range) {
        parts.push_back("price range $" + format_price(prefs.price_range->first) + " to $" +
                        format_price(prefs.price_range->second));
    }
    if (present(prefs.diamond_color)) parts.push_back("prefers " + *prefs.diamond_color + " color diamonds");
    if (present(prefs.diamond_shape)) parts.push_back("prefers " + *prefs.diamond_shape + " shape");
    if (parts.empty()) return "no specific preferences";
    std::string out = parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i) out += ". " + parts[i];
    return out;
}

} // namespace facet::personalization
