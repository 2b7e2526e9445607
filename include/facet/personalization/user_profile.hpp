#pragma once

/** \file user_profile.hpp
 *  \brief User profile record and the hybrid preference vector.
 *
 * A profile combines an explicit preference embedding with the interaction
 * history. The history operand is a decay-weighted average of the
 * interacted item embeddings:
 *
 *   w_i   = weight_i * 2^(-age_days_i / half_life_days)   (age <= 0 -> factor 1)
 *   inter = normalize(sum_i w_i * unit(e_i) / sum_i w_i)
 *   user  = normalize(base_weight * unit(pref) + interaction_weight * inter)
 *
 * With only one operand present that operand is the user vector; with none
 * the vector is absent. Old interactions fade but are only dropped by the
 * log cap, never by age.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "facet/error.hpp"

namespace facet::personalization {

enum class interaction_type : std::uint8_t { click = 0, like = 1, purchase = 2 };

/** \brief "click" | "like" | "purchase" (case-insensitive); invalid_argument otherwise. */
auto parse_interaction_type(std::string_view s) -> std::expected<interaction_type, core::error>;

auto to_string(interaction_type t) noexcept -> std::string_view;

/** \brief Default weight of an interaction kind: click 1, like 2, purchase 5. */
constexpr auto default_weight(interaction_type t) noexcept -> float {
    switch (t) {
        case interaction_type::click: return 1.0f;
        case interaction_type::like: return 2.0f;
        case interaction_type::purchase: return 5.0f;
    }
    return 1.0f;
}

struct InteractionEvent {
    std::vector<float> embedding;              /**< interacted item, stored unit-normalized */
    interaction_type type{interaction_type::click};
    float weight{1.0f};
    double timestamp{0.0};                     /**< unix seconds */
    std::optional<std::string> item_id;        /**< "<dataset>:<id>" when known */
};

struct UserProfile {
    std::string user_id;
    std::optional<std::vector<float>> preference;   /**< unit vector of the preference text */
    std::optional<std::string> preference_text;
    std::vector<InteractionEvent> interactions;     /**< oldest first */
};

struct PreferenceModelConfig {
    float base_weight{0.6f};
    float interaction_weight{0.4f};
    double half_life_days{30.0};
    std::size_t max_interactions{100};
    std::size_t sparse_threshold{3};     /**< fewer interactions than this is a cold profile */
};

/** \brief Explicit preferences as entered by the user; every field optional. */
struct PreferenceMap {
    std::optional<std::string> metal;
    std::optional<std::string> style;
    std::optional<std::pair<double, double>> price_range;
    std::optional<std::string> diamond_color;
    std::optional<std::string> diamond_shape;
};

/** \brief Current wall clock in unix seconds. */
auto now_seconds() -> double;

/** \brief 2^(-age_days / half_life_days); 1 for non-positive ages. */
auto decay_factor(double age_days, double half_life_days) noexcept -> double;

/** \brief Event weight times its decay factor at \p now. */
auto decay_weight(const InteractionEvent& e, double now, const PreferenceModelConfig& cfg) noexcept -> double;

/** \brief Decay-weighted interaction operand, nullopt without usable events. */
auto interaction_vector(const UserProfile& p, double now, const PreferenceModelConfig& cfg)
    -> std::optional<std::vector<float>>;

/** \brief Hybrid user vector, nullopt when the profile has neither operand. */
auto hybrid_vector(const UserProfile& p, double now, const PreferenceModelConfig& cfg)
    -> std::optional<std::vector<float>>;

/** \brief Fewer than sparse_threshold logged interactions. */
auto is_sparse(const UserProfile& p, const PreferenceModelConfig& cfg) noexcept -> bool;

/** \brief Normalized mean of the last \p window interaction embeddings. */
auto recent_trend(const UserProfile& p, std::size_t window) -> std::optional<std::vector<float>>;

/** \brief Append \p e and drop the oldest entries beyond max_interactions. */
void append_interaction(UserProfile& p, InteractionEvent e, const PreferenceModelConfig& cfg);

/** \brief Sentence form of the preferences, e.g.
 *  "prefers rose gold. prefers vintage style. price range $1000 to $5000";
 *  "no specific preferences" when every field is empty.
 */
auto preference_text(const PreferenceMap& prefs) -> std::string;

} // namespace facet::personalization
