#pragma once

/** \file compatibility.hpp
 *  \brief Rule-based diamond/setting compatibility and hint matching.
 *
 * All functions are pure and read only the item attribute maps. Absent
 * attributes contribute nothing (they never fail).
 */

#include <string>
#include <string_view>

#include "facet/metadata/item.hpp"
#include "facet/scoring/query_hints.hpp"

namespace facet::scoring {

/** \brief Rule credits for a (diamond, setting) pair, clipped to [0, 1].
 *
 * | rule                                                   | credit |
 * |--------------------------------------------------------|--------|
 * | color D/E/F and metal platinum or white gold           | 0.30   |
 * | color G/H/I                                            | 0.20   |
 * | color J/K/L and metal yellow, pink or rose gold        | 0.25   |
 * | cut round or brilliant                                 | 0.20   |
 * | cut princess/cushion/emerald and style vintage/classic | 0.25   |
 * | setting share of total price in [0.20, 0.40]           | 0.20   |
 * | setting share of total price in [0.15, 0.50]           | 0.10   |
 * | carat > 2.0 and band width >= 2.0 mm                   | 0.10   |
 * | carat < 0.5 and band width absent or <= 3.0 mm         | 0.10   |
 */
auto compatibility(const metadata::Item& diamond, const metadata::Item& setting) -> float;

/** \brief Credit for matching the hints: metal 0.4, color 0.3, shape 0.3, capped at 1. */
auto attribute_boost(const metadata::Item& diamond, const metadata::Item& setting,
                     const QueryHints& hints) -> float;

/** \brief Cheap prefilter; false for an extreme price split or a large stone
 *  (> 3 ct) on a band narrower than 1.5 mm.
 */
auto quick_compatibility_check(const metadata::Item& diamond, const metadata::Item& setting) -> bool;

/** \brief Setting metal matches \p metal by substring in either direction.
 *  An absent or empty setting metal never matches.
 */
auto metal_matches(const metadata::Item& setting, std::string_view metal) -> bool;

/** \brief Diamond color equals \p color (case-insensitive). */
auto color_matches(const metadata::Item& diamond, std::string_view color) -> bool;

/** \brief Diamond shape matches \p shape by substring in either direction. */
auto shape_matches(const metadata::Item& diamond, std::string_view shape) -> bool;

/** \brief Lower-cased metal of a setting: "metal", else the joined "metals" list. */
auto setting_metal(const metadata::Item& setting) -> std::string;

} // namespace facet::scoring
