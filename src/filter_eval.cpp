#include "facet/filter_eval.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace facet::filter_eval {

namespace {

auto lower(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

auto in_range(const metadata::Item& item, std::string_view attribute,
              double lo, double hi, bool nonpositive_is_missing) -> bool {
  const auto v = metadata::number(item, attribute);
  if (!v) return true;
  if (nonpositive_is_missing && *v <= 0.0) return true;
  return *v >= lo && *v <= hi;
}

auto matches_set(const categorical_set& s, const metadata::Item& item) -> bool {
  const auto values = metadata::texts(item, s.attribute);
  if (values.empty()) return true;
  for (const auto& raw : values) {
    const auto have = lower(raw);
    for (const auto& want : s.values) {
      if (s.mode == match_mode::exact ? have == want
                                      : have.find(want) != std::string::npos) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

auto matches(const criterion& c, const metadata::Item& item) -> bool {
  if (const auto* p = std::get_if<price_range>(&c)) {
    return in_range(item, metadata::attr::price, p->min_value, p->max_value, p->nonpositive_is_missing);
  }
  if (const auto* r = std::get_if<numeric_range>(&c)) {
    return in_range(item, r->attribute, r->min_value, r->max_value, r->nonpositive_is_missing);
  }
  return matches_set(std::get<categorical_set>(c), item);
}

auto matches(const filter_criteria& f, const metadata::Item& item) -> bool {
  for (const auto& c : f.criteria()) {
    if (!matches(c, item)) return false;
  }
  return true;
}

auto eligible(const filter_criteria& f, std::span<const metadata::Item> items) -> roaring::Roaring {
  roaring::Roaring out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (matches(f, items[i])) out.add(static_cast<std::uint32_t>(i));
  }
  return out;
}

} // namespace facet::filter_eval
