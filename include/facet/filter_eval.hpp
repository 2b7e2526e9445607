#pragma once

/** \file filter_eval.hpp
 *  \brief Uniform predicate evaluation of filter_criteria over catalog items.
 *
 * Semantics:
 * - All criteria must pass (conjunction).
 * - Numeric bounds are inclusive; NaN bounds never occur (rejected at parse).
 * - An item without the attribute passes; with nonpositive_is_missing a value
 *   <= 0 counts as absent.
 * - Categorical: any requested value matching any item value passes.
 *   substring mode: requested value contained in the item value; exact mode:
 *   equality. Both are case-insensitive.
 */

#include <span>

#include <roaring/roaring.hh>

#include "facet/filter_criteria.hpp"
#include "facet/metadata/item.hpp"

namespace facet::filter_eval {

/** \brief Evaluate one criterion against one item. */
auto matches(const criterion& c, const metadata::Item& item) -> bool;

/** \brief Evaluate a whole filter against one item. */
auto matches(const filter_criteria& f, const metadata::Item& item) -> bool;

/** \brief Positions of items that pass \p f. */
auto eligible(const filter_criteria& f, std::span<const metadata::Item> items) -> roaring::Roaring;

} // namespace facet::filter_eval
