#pragma once

/** \file item.hpp
 *  \brief Catalog item record and its persisted attribute file.
 *
 * An item carries a stable string id and a typed attribute map. Items are
 * immutable once a pool has been built from them.
 *
 * On-disk format ("facet-meta v1", native little-endian):
 *   u32 magic 'FMTA' | u32 version=1 | u64 n_items
 *   per item: str id | u64 n_attrs | per attr: str key | u8 tag | payload
 *   tags: 0 string, 1 double, 2 int64, 3 bool, 4 string list (u64 n | str...)
 *   str = u64 length + bytes
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "facet/error.hpp"

namespace facet::metadata {

/** \brief Supported attribute value types. */
using AttributeValue = std::variant<std::string, double, std::int64_t, bool, std::vector<std::string>>;

using AttributeMap = std::unordered_map<std::string, AttributeValue>;

/** \brief One catalog record (diamond, setting or ring). */
struct Item {
    std::string id;
    AttributeMap attributes;
};

/** \brief Attribute names used by the catalogs. */
namespace attr {
inline constexpr std::string_view price = "price";
inline constexpr std::string_view metal = "metal";
inline constexpr std::string_view metals = "metals";
inline constexpr std::string_view style = "style";
inline constexpr std::string_view styles = "styles";
inline constexpr std::string_view color = "color";
inline constexpr std::string_view clarity = "clarity";
inline constexpr std::string_view carat = "carat_weight";
inline constexpr std::string_view shape = "shape";
inline constexpr std::string_view cut = "cut";
inline constexpr std::string_view lab = "lab";
inline constexpr std::string_view band_width = "band_width_mm";
inline constexpr std::string_view gemstones = "gemstones";
} // namespace attr

/** \brief Numeric attribute (double or int64), nullopt if absent or non-numeric. */
auto number(const Item& item, std::string_view key) -> std::optional<double>;

/** \brief String attribute, nullopt if absent or not a string. */
auto text(const Item& item, std::string_view key) -> std::optional<std::string>;

/** \brief String or string-list attribute flattened to a list; empty if absent. */
auto texts(const Item& item, std::string_view key) -> std::vector<std::string>;

/** \brief Price with absent or non-positive values mapped to 0. */
auto price_or_zero(const Item& item) -> double;

/** \brief Write items in "facet-meta v1" format. */
auto save_items(const std::filesystem::path& path, std::span<const Item> items)
    -> std::expected<void, core::error>;

/** \brief Read a "facet-meta v1" file.
 *
 * Errors: io_failed when the file cannot be opened; data_integrity on a bad
 * header, truncated record or unknown type tag.
 */
auto load_items(const std::filesystem::path& path)
    -> std::expected<std::vector<Item>, core::error>;

} // namespace facet::metadata
