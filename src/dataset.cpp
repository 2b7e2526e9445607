#include "facet/dataset.hpp"

#include <array>
#include <string>

#include "facet/metadata/item.hpp"

namespace facet {

namespace {

namespace attr = metadata::attr;

constexpr std::array<numeric_field, 2> kDiamondNumeric{{
  {"price", attr::price, true},
  {"carat", attr::carat, true},
}};
constexpr std::array<categorical_field, 5> kDiamondCategorical{{
  {"color", attr::color, match_mode::exact},
  {"clarity", attr::clarity, match_mode::exact},
  {"cut", attr::cut, match_mode::exact},
  {"shape", attr::shape, match_mode::exact},
  {"lab", attr::lab, match_mode::exact},
}};

constexpr std::array<numeric_field, 2> kSettingNumeric{{
  {"price", attr::price, false},
  {"band_width", attr::band_width, false},
}};
constexpr std::array<categorical_field, 3> kSettingCategorical{{
  {"metal", attr::metal, match_mode::substring},
  {"style", attr::style, match_mode::substring},
  {"gemstones", attr::gemstones, match_mode::substring},
}};

// Cartier rings carry list-valued metals and styles.
constexpr std::array<numeric_field, 2> kCartierNumeric{{
  {"price", attr::price, false},
  {"band_width", attr::band_width, false},
}};
constexpr std::array<categorical_field, 3> kCartierCategorical{{
  {"metal", attr::metals, match_mode::substring},
  {"styles", attr::styles, match_mode::substring},
  {"gemstones", attr::gemstones, match_mode::substring},
}};

const dataset_schema kDiamondSchema{dataset::diamonds, kDiamondNumeric, kDiamondCategorical};
const dataset_schema kSettingSchema{dataset::settings, kSettingNumeric, kSettingCategorical};
const dataset_schema kCartierSchema{dataset::cartier, kCartierNumeric, kCartierCategorical};

} // namespace

auto parse_dataset(std::string_view name) -> std::expected<dataset, core::error> {
  if (name == "diamonds") return dataset::diamonds;
  if (name == "settings") return dataset::settings;
  if (name == "cartier") return dataset::cartier;
  return std::unexpected(core::error{core::error_code::unknown_dataset,
      "Unknown dataset '" + std::string(name) + "'", "dataset"});
}

auto to_string(dataset d) noexcept -> std::string_view {
  switch (d) {
    case dataset::diamonds: return "diamonds";
    case dataset::settings: return "settings";
    case dataset::cartier: return "cartier";
  }
  return "unknown";
}

auto qualified_id(dataset d, std::string_view id) -> std::string {
  std::string out(to_string(d));
  out.push_back(':');
  out.append(id);
  return out;
}

auto schema_for(dataset d) noexcept -> const dataset_schema& {
  switch (d) {
    case dataset::settings: return kSettingSchema;
    case dataset::cartier: return kCartierSchema;
    case dataset::diamonds: break;
  }
  return kDiamondSchema;
}

auto find_numeric(const dataset_schema& s, std::string_view key) noexcept -> const numeric_field* {
  for (const auto& f : s.numeric) {
    if (f.key == key) return &f;
  }
  return nullptr;
}

auto find_categorical(const dataset_schema& s, std::string_view key) noexcept -> const categorical_field* {
  for (const auto& f : s.categorical) {
    if (f.key == key) return &f;
  }
  return nullptr;
}

} // namespace facet
