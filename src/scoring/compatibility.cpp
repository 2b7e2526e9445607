#include "facet/scoring/compatibility.hpp"

#include <algorithm>
#include <initializer_list>
#include <string>

namespace facet::scoring {

namespace {

auto contains(std::string_view hay, std::string_view needle) -> bool {
    return hay.find(needle) != std::string_view::npos;
}

auto contains_any(std::string_view hay, std::initializer_list<std::string_view> needles) -> bool {
    return std::any_of(needles.begin(), needles.end(),
                       [&](std::string_view n) { return contains(hay, n); });
}

auto two_way(std::string_view a, std::string_view b) -> bool {
    if (a.empty() || b.empty()) return false;
    return contains(a, b) || contains(b, a);
}

auto lower_text(const metadata::Item& item, std::string_view key) -> std::string {
    return to_lower(metadata::text(item, key).value_or(std::string{}));
}

auto setting_style(const metadata::Item& setting) -> std::string {
    std::string out;
    for (const auto& s : metadata::texts(setting, metadata::attr::style)) out += to_lower(s) + " ";
    for (const auto& s : metadata::texts(setting, metadata::attr::styles)) out += to_lower(s) + " ";
    return out;
}

auto positive(const metadata::Item& item, std::string_view key) -> double {
    const double v = metadata::number(item, key).value_or(0.0);
    return v > 0.0 ? v : 0.0;
}

// Setting share of the pair price, or a negative value when either price is missing.
auto setting_share(const metadata::Item& diamond, const metadata::Item& setting) -> double {
    const double dp = metadata::price_or_zero(diamond);
    const double sp = metadata::price_or_zero(setting);
    if (dp <= 0.0 || sp <= 0.0) return -1.0;
    return sp / (dp + sp);
}

} // namespace

auto setting_metal(const metadata::Item& setting) -> std::string {
    if (auto m = metadata::text(setting, metadata::attr::metal); m && !m->empty()) return to_lower(*m);
    std::string out;
    for (const auto& m : metadata::texts(setting, metadata::attr::metals)) {
        if (!out.empty()) out.push_back(' ');
        out += to_lower(m);
    }
    return out;
}

auto compatibility(const metadata::Item& diamond, const metadata::Item& setting) -> float {
    double score = 0.0;

    const auto color = to_upper(metadata::text(diamond, metadata::attr::color).value_or(std::string{}));
    const auto metal = setting_metal(setting);
    if (color == "D" || color == "E" || color == "F") {
        if (contains_any(metal, {"platinum", "white gold"})) score += 0.3;
    } else if (color == "G" || color == "H" || color == "I") {
        score += 0.2;
    } else if (color == "J" || color == "K" || color == "L") {
        if (contains_any(metal, {"yellow gold", "pink gold", "rose gold"})) score += 0.25;
    }

    const auto cut = lower_text(diamond, metadata::attr::cut);
    if (contains_any(cut, {"round", "brilliant"})) {
        score += 0.2;
    } else if (contains_any(cut, {"princess", "cushion", "emerald"})) {
        if (contains_any(setting_style(setting), {"vintage", "classic"})) score += 0.25;
    }

    if (const double share = setting_share(diamond, setting); share >= 0.0) {
        if (share >= 0.2 && share <= 0.4) {
            score += 0.2;
        } else if (share >= 0.15 && share <= 0.5) {
            score += 0.1;
        }
    }

    const double carat = positive(diamond, metadata::attr::carat);
    const double band = positive(setting, metadata::attr::band_width);
    if (carat > 2.0) {
        if (band >= 2.0) score += 0.1;
    } else if (carat > 0.0 && carat < 0.5) {
        if (band == 0.0 || band <= 3.0) score += 0.1;
    }

    return static_cast<float>(std::min(1.0, score));
}

auto metal_matches(const metadata::Item& setting, std::string_view metal) -> bool {
    return two_way(setting_metal(setting), to_lower(metal));
}

auto color_matches(const metadata::Item& diamond, std::string_view color) -> bool {
    const auto c = metadata::text(diamond, metadata::attr::color);
    return c && !c->empty() && to_upper(*c) == to_upper(color);
}

auto shape_matches(const metadata::Item& diamond, std::string_view shape) -> bool {
    return two_way(lower_text(diamond, metadata::attr::shape), to_lower(shape));
}

auto attribute_boost(const metadata::Item& diamond, const metadata::Item& setting,
                     const QueryHints& hints) -> float {
    float boost = 0.0f;
    if (hints.metal && metal_matches(setting, *hints.metal)) boost += 0.4f;
    if (hints.color && color_matches(diamond, *hints.color)) boost += 0.3f;
    if (hints.shape && shape_matches(diamond, *hints.shape)) boost += 0.3f;
    return std::min(1.0f, boost);
}

auto quick_compatibility_check(const metadata::Item& diamond, const metadata::Item& setting) -> bool {
    if (const double share = setting_share(diamond, setting); share >= 0.0) {
        if (share < 0.1 || share > 0.6) return false;
    }
    const double carat = positive(diamond, metadata::attr::carat);
    const double band = positive(setting, metadata::attr::band_width);
    if (carat > 3.0 && band > 0.0 && band < 1.5) return false;
    return true;
}

} // namespace facet::scoring
