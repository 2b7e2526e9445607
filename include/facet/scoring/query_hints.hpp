#pragma once

/** \file query_hints.hpp
 *  \brief Metal / color-grade / shape hints from query text or top candidates.
 *
 * Text extraction is lexicon based; a hint found in the text is explicit and
 * becomes a hard constraint downstream. Hints that remain unset can be
 * inferred by majority vote over the best candidates; inferred hints only
 * steer scoring and never filter.
 */

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "facet/metadata/item.hpp"

namespace facet::scoring {

/** \brief Extracted attribute hints. */
struct QueryHints {
    std::optional<std::string> metal;   /**< "platinum", "white gold", "yellow gold", "rose gold" or an inferred setting metal (lower-case) */
    std::optional<std::string> color;   /**< upper-case grade "D".."N" */
    std::optional<std::string> shape;   /**< capitalized, e.g. "Round" */
    bool metal_explicit{false};
    bool color_explicit{false};
    bool shape_explicit{false};

    auto any() const noexcept -> bool { return metal || color || shape; }
};

/** \brief Lexicon extraction; first match wins within each hint family.
 *
 * Metal lexicon order: platinum, white gold, yellow gold, rose gold; keywords
 * match on word boundaries. A color grade is a standalone single-letter token
 * D..N next to "color"/"colour"/"grade", or written upper-case ("I" only next
 * to those words).
 */
auto extract_query_hints(std::string_view text) -> QueryHints;

/** \brief Fill unset hints by majority vote over the first \p top_n entries.
 *
 * Metal votes come from settings, color and shape votes from diamonds. Ties
 * go to the value seen first. Explicit hints are never overwritten.
 */
auto infer_hints(QueryHints hints,
                 std::span<const metadata::Item* const> top_diamonds,
                 std::span<const metadata::Item* const> top_settings,
                 std::size_t top_n = 5) -> QueryHints;

/** \brief Lower-case copy (ASCII). */
auto to_lower(std::string_view s) -> std::string;

/** \brief Upper-case copy (ASCII). */
auto to_upper(std::string_view s) -> std::string;

} // namespace facet::scoring
