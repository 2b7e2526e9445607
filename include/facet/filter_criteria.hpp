#pragma once

/** \file filter_criteria.hpp
 *  \brief Validated per-dataset attribute filter (conjunction of criteria).
 *
 * Criteria:
 * - price_range: inclusive bounds on the item price.
 * - numeric_range: inclusive bounds on another numeric attribute.
 * - categorical_set: passes if any requested value matches the attribute.
 *
 * A filter_criteria is bound to one dataset and only holds criteria whose
 * fields belong to that dataset's schema. Construction is the only place keys
 * and bounds are validated; evaluation (see filter_eval.hpp) never fails.
 */

#include <expected>
#include <limits>
#include <map>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "facet/dataset.hpp"
#include "facet/error.hpp"

namespace facet {

/** \brief Inclusive price bounds. */
struct price_range {
  double min_value{-std::numeric_limits<double>::infinity()};
  double max_value{std::numeric_limits<double>::infinity()};
  bool nonpositive_is_missing{false};
};

/** \brief Inclusive bounds on a numeric attribute. */
struct numeric_range {
  std::string attribute;
  double min_value{-std::numeric_limits<double>::infinity()};
  double max_value{std::numeric_limits<double>::infinity()};
  bool nonpositive_is_missing{false};
};

/** \brief Any-of membership on a categorical attribute. */
struct categorical_set {
  std::string attribute;
  std::vector<std::string> values;     /**< lower-cased, non-empty */
  match_mode mode{match_mode::exact};
};

using criterion = std::variant<price_range, numeric_range, categorical_set>;

/** \brief Raw boundary input: key -> value ("1000", "platinum,white gold"). */
using raw_filters = std::map<std::string, std::string>;

class filter_criteria {
public:
  explicit filter_criteria(dataset kind) noexcept : kind_(kind) {}

  /** \brief Validate raw key/value filters against the dataset schema.
   *
   * Numeric keys are "<field>_min"/"<field>_max"; categorical keys take a
   * comma-separated list. Blank values are ignored.
   * Errors: unknown_filter_key for keys outside the schema, invalid_argument
   * for non-numeric bounds or min > max.
   */
  static auto parse(dataset kind, const raw_filters& raw)
      -> std::expected<filter_criteria, core::error>;

  /** \brief Add (or replace) a numeric bound on a schema field key stem. */
  auto set_range(std::string_view key, double min_value, double max_value)
      -> std::expected<void, core::error>;

  /** \brief Add (or replace) a categorical constraint on a schema field key. */
  auto set_values(std::string_view key, std::vector<std::string> values)
      -> std::expected<void, core::error>;

  auto kind() const noexcept -> dataset { return kind_; }
  auto criteria() const noexcept -> std::span<const criterion> { return criteria_; }
  auto empty() const noexcept -> bool { return criteria_.empty(); }

private:
  dataset kind_;
  std::vector<criterion> criteria_;
};

} // namespace facet
