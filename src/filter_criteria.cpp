#include "facet/filter_criteria.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <string_view>
#include <utility>

#include "facet/metadata/item.hpp"

namespace facet {

namespace {

auto lower(std::string_view s) -> std::string {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

auto trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

auto parse_double(std::string_view s) -> std::optional<double> {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  double v{};
  const auto* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc{} || ptr != end || !std::isfinite(v)) return std::nullopt;
  return v;
}

auto split_list(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> out;
  while (!s.empty()) {
    const auto pos = s.find(',');
    auto part = trim(s.substr(0, pos));
    if (!part.empty()) out.push_back(std::string(part));
    if (pos == std::string_view::npos) break;
    s.remove_prefix(pos + 1);
  }
  return out;
}

auto attribute_of(const criterion& c) -> std::string_view {
  if (std::holds_alternative<price_range>(c)) return metadata::attr::price;
  if (const auto* r = std::get_if<numeric_range>(&c)) return r->attribute;
  return std::get<categorical_set>(c).attribute;
}

} // namespace

auto filter_criteria::set_range(std::string_view key, double min_value, double max_value)
    -> std::expected<void, core::error> {
  const auto* field = find_numeric(schema_for(kind_), key);
  if (!field) {
    return std::unexpected(core::error{core::error_code::unknown_filter_key,
        "Unknown numeric filter '" + std::string(key) + "' for " + std::string(to_string(kind_)),
        "filter.criteria"});
  }
  if (std::isnan(min_value) || std::isnan(max_value) || min_value > max_value) {
    return std::unexpected(core::error{core::error_code::invalid_argument,
        "Empty range for '" + std::string(key) + "'", "filter.criteria"});
  }
  criterion c = field->attribute == metadata::attr::price
      ? criterion{price_range{min_value, max_value, field->nonpositive_is_missing}}
      : criterion{numeric_range{std::string(field->attribute), min_value, max_value,
                                field->nonpositive_is_missing}};
  std::erase_if(criteria_, [&](const criterion& e) { return attribute_of(e) == field->attribute; });
  criteria_.push_back(std::move(c));
  return {};
}

auto filter_criteria::set_values(std::string_view key, std::vector<std::string> values)
    -> std::expected<void, core::error> {
  const auto* field = find_categorical(schema_for(kind_), key);
  if (!field) {
    return std::unexpected(core::error{core::error_code::unknown_filter_key,
        "Unknown categorical filter '" + std::string(key) + "' for " + std::string(to_string(kind_)),
        "filter.criteria"});
  }
  categorical_set set{std::string(field->attribute), {}, field->mode};
  for (auto& v : values) {
    auto t = trim(v);
    if (!t.empty()) set.values.push_back(lower(t));
  }
  std::erase_if(criteria_, [&](const criterion& e) { return attribute_of(e) == field->attribute; });
  // An empty list constrains nothing.
  if (!set.values.empty()) criteria_.push_back(std::move(set));
  return {};
}

auto filter_criteria::parse(dataset kind, const raw_filters& raw)
    -> std::expected<filter_criteria, core::error> {
  filter_criteria out(kind);
  const auto& schema = schema_for(kind);

  // Collect numeric bounds per key stem first so min and max merge.
  std::map<std::string, std::pair<double, double>> bounds;
  for (const auto& [key, value] : raw) {
    if (find_categorical(schema, key)) {
      if (auto r = out.set_values(key, split_list(value)); !r) return std::unexpected(r.error());
      continue;
    }
    const bool is_min = key.ends_with("_min");
    const bool is_max = key.ends_with("_max");
    const std::string stem = (is_min || is_max) ? key.substr(0, key.size() - 4) : key;
    if ((!is_min && !is_max) || !find_numeric(schema, stem)) {
      return std::unexpected(core::error{core::error_code::unknown_filter_key,
          "Unknown filter key '" + key + "' for " + std::string(to_string(kind)),
          "filter.criteria"});
    }
    if (trim(value).empty()) continue;
    const auto v = parse_double(value);
    if (!v) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
          "Non-numeric value for '" + key + "'", "filter.criteria"});
    }
    auto [it, inserted] = bounds.try_emplace(stem, -std::numeric_limits<double>::infinity(),
                                             std::numeric_limits<double>::infinity());
    (is_min ? it->second.first : it->second.second) = *v;
  }
  for (const auto& [stem, b] : bounds) {
    if (auto r = out.set_range(stem, b.first, b.second); !r) return std::unexpected(r.error());
  }
  return out;
}

} // namespace facet
