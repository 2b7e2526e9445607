#include "facet_test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <random>
#include <stdexcept>

#include "facet/kernels/distance.hpp"

namespace facet_test_helpers {

std::vector<float> random_unit(std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    for (auto& x : v) x = dist(gen);
    if (!facet::kernels::normalize(v)) v[0] = 1.0f;
    return v;
}

std::vector<std::vector<float>> random_units(std::size_t n, std::size_t dim, std::uint32_t base_seed) {
    std::vector<std::vector<float>> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.push_back(random_unit(dim, base_seed + static_cast<std::uint32_t>(i)));
    return out;
}

std::vector<float> axis(std::size_t dim, std::size_t i) {
    std::vector<float> v(dim, 0.0f);
    v[i] = 1.0f;
    return v;
}

std::vector<float> blend(std::span<const float> a, float wa, std::span<const float> b, float wb) {
    std::vector<float> out(a.size(), 0.0f);
    facet::kernels::axpy(wa, a, out);
    facet::kernels::axpy(wb, b, out);
    (void)facet::kernels::normalize(out);
    return out;
}

facet::metadata::Item make_item(std::string id, facet::metadata::AttributeMap attrs) {
    return facet::metadata::Item{std::move(id), std::move(attrs)};
}

facet::index::Pool make_pool(facet::dataset kind, const std::vector<std::vector<float>>& rows,
                             std::vector<facet::metadata::Item> items,
                             facet::index::PoolBuildConfig cfg) {
    auto m = facet::index::make_matrix(rows);
    if (!m) throw std::runtime_error(m.error().message);
    auto p = facet::index::Pool::build(kind, std::move(*m), std::move(items), cfg);
    if (!p) throw std::runtime_error(p.error().message);
    return std::move(*p);
}

TempDir::TempDir(std::string_view tag) {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("facet_" + std::string(tag) + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

auto FakeEmbedder::embed_text(std::string_view text) const -> std::optional<std::vector<float>> {
    if (std::find(failing_.begin(), failing_.end(), text) != failing_.end()) return std::nullopt;
    if (auto it = texts_.find(std::string(text)); it != texts_.end()) return it->second;
    return random_unit(dim_, static_cast<std::uint32_t>(std::hash<std::string_view>{}(text)));
}

auto FakeEmbedder::embed_image(std::span<const std::uint8_t> bytes) const -> std::optional<std::vector<float>> {
    return random_unit(dim_, 0x1000u + static_cast<std::uint32_t>(bytes.size()));
}

} // namespace facet_test_helpers
