#pragma once

/** \file dataset.hpp
 *  \brief Catalog datasets and their filterable attribute schema.
 *
 * Each dataset names the filter keys it accepts. Numeric fields accept
 * "<key>_min" / "<key>_max"; categorical fields accept the key itself.
 * Free-text categoricals (metal, style, gemstones) match by case-insensitive
 * substring, coded grades (color, clarity, cut, shape, lab) by case-insensitive
 * equality.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "facet/error.hpp"

namespace facet {

enum class dataset : std::uint8_t { diamonds, settings, cartier };

enum class match_mode : std::uint8_t { substring, exact };

/** \brief Numeric filter field. */
struct numeric_field {
  std::string_view key;                 /**< filter key stem, e.g. "carat" */
  std::string_view attribute;           /**< item attribute, e.g. "carat_weight" */
  bool nonpositive_is_missing{false};   /**< treat values <= 0 as absent */
};

/** \brief Categorical filter field. */
struct categorical_field {
  std::string_view key;
  std::string_view attribute;
  match_mode mode{match_mode::exact};
};

struct dataset_schema {
  dataset kind{dataset::diamonds};
  std::span<const numeric_field> numeric;
  std::span<const categorical_field> categorical;
};

/** \brief Parse a dataset name ("diamonds", "settings", "cartier").
 *  \return unknown_dataset for any other name.
 */
auto parse_dataset(std::string_view name) -> std::expected<dataset, core::error>;

auto to_string(dataset d) noexcept -> std::string_view;

/** \brief Catalog-wide item key "<dataset>:<id>". */
auto qualified_id(dataset d, std::string_view id) -> std::string;

auto schema_for(dataset d) noexcept -> const dataset_schema&;

/** \brief Find the numeric field with the given key stem, or nullptr. */
auto find_numeric(const dataset_schema& s, std::string_view key) noexcept -> const numeric_field*;

/** \brief Find the categorical field with the given key, or nullptr. */
auto find_categorical(const dataset_schema& s, std::string_view key) noexcept -> const categorical_field*;

} // namespace facet
