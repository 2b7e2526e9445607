/**
 * Ring builder example using facet
 *
 * This example demonstrates:
 * - Opening a service over a synthetic diamond/setting catalog
 * - Filtered single-pool search
 * - Logging interactions and stating preferences
 * - Personalized (diamond, setting) combinations
 *
 * The embedder below hashes words into a small vector space; a real
 * deployment injects a multimodal model instead.
 */

#include <facet/service.hpp>
#include <facet/kernels/distance.hpp>
#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kDim = 64;

// Bag-of-words hashing embedder.
class HashingEmbedder final : public facet::embedding::Embedder {
public:
    auto embed_text(std::string_view text) const -> std::optional<std::vector<float>> override {
        std::vector<float> v(kDim, 0.0f);
        std::istringstream words{std::string(facet::scoring::to_lower(text))};
        std::string w;
        while (words >> w) v[std::hash<std::string>{}(w) % kDim] += 1.0f;
        if (!facet::kernels::normalize(v)) return std::nullopt;
        return v;
    }
    auto embed_image(std::span<const std::uint8_t>) const -> std::optional<std::vector<float>> override {
        return std::nullopt;
    }
    auto dimension() const noexcept -> std::size_t override { return kDim; }
};

facet::index::Pool synthetic_pool(facet::dataset kind, const HashingEmbedder& embedder) {
    static const char* kColors[] = {"D", "E", "F", "G", "H", "I", "J", "K"};
    static const char* kShapes[] = {"Round", "Oval", "Cushion", "Pear", "Emerald"};
    static const char* kMetals[] = {"Platinum", "14k White Gold", "18k Yellow Gold", "Rose Gold"};
    static const char* kStyles[] = {"Solitaire", "Halo", "Vintage", "Pave"};

    std::mt19937 gen(kind == facet::dataset::diamonds ? 1 : 2);
    std::uniform_real_distribution<double> price(0.0, 1.0);
    std::vector<facet::metadata::Item> items;
    std::vector<std::vector<float>> rows;
    const std::size_t n = kind == facet::dataset::diamonds ? 400 : 120;
    for (std::size_t i = 0; i < n; ++i) {
        facet::metadata::Item item;
        item.id = std::to_string(i);
        std::string description;
        if (kind == facet::dataset::diamonds) {
            const std::string color = kColors[i % 8];
            const std::string shape = kShapes[i % 5];
            item.attributes["color"] = color;
            item.attributes["shape"] = shape;
            item.attributes["carat_weight"] = 0.3 + price(gen) * 2.5;
            item.attributes["price"] = 1500.0 + price(gen) * 12000.0;
            description = shape + " " + color + " color diamond";
        } else {
            const std::string metal = kMetals[i % 4];
            const std::string style = kStyles[i % 4];
            item.attributes["metal"] = metal;
            item.attributes["style"] = style;
            item.attributes["band_width_mm"] = 1.6 + price(gen) * 1.5;
            item.attributes["price"] = 600.0 + price(gen) * 4000.0;
            description = metal + " " + style + " setting";
        }
        rows.push_back(embedder.embed_text(description).value());
        items.push_back(std::move(item));
    }
    auto m = facet::index::make_matrix(rows);
    auto pool = facet::index::Pool::build(kind, std::move(m.value()), std::move(items));
    return std::move(pool.value());
}

void print(const facet::search::RecommendResponse& r) {
    if (!r.note.empty()) std::cout << "  " << r.note << std::endl;
    for (const auto& c : r.combinations) {
        std::cout << "  diamond " << c.diamond->id << " ("
                  << facet::metadata::text(*c.diamond, "shape").value_or("?") << ", "
                  << facet::metadata::text(*c.diamond, "color").value_or("?") << ")"
                  << " + setting " << c.setting->id << " ("
                  << facet::metadata::text(*c.setting, "metal").value_or("?") << ")"
                  << "  score=" << c.score << "  total=$" << static_cast<long>(c.total_price) << std::endl;
    }
}

} // namespace

int main() {
    using namespace facet;

    auto embedder = std::make_shared<HashingEmbedder>();
    auto config = config_from_env();
    if (!config) {
        std::cerr << "Bad configuration: [" << core::to_string(config.error().code) << "] " << config.error().message << std::endl;
        return 1;
    }

    auto service = Service::open(*config, embedder,
        [embedder](dataset kind) -> std::expected<index::Pool, core::error> {
            if (kind == dataset::cartier) {
                return std::unexpected(core::error{core::error_code::not_found, "No cartier catalog in this demo", "example"});
            }
            return synthetic_pool(kind, *embedder);
        });
    if (!service) {
        std::cerr << "Failed to open service: [" << core::to_string(service.error().code) << "] " << service.error().message << std::endl;
        return 1;
    }

    auto query = service->embed_query("oval diamond in rose gold", std::nullopt);
    if (!query) {
        std::cerr << "Query failed: [" << core::to_string(query.error().code) << "] " << query.error().message << std::endl;
        return 1;
    }

    // Filtered search over one pool.
    auto hits = service->search("diamonds", *query, 5, raw_filters{{"price_max", "6000"}, {"shape", "oval"}});
    if (!hits) {
        std::cerr << "Search failed: [" << core::to_string(hits.error().code) << "] " << hits.error().message << std::endl;
        return 1;
    }
    std::cout << "Oval diamonds under $6000:" << std::endl;
    for (const auto& h : hits->hits) {
        std::cout << "  " << h.id << "  score=" << h.score
                  << "  price=$" << static_cast<long>(metadata::price_or_zero(*h.item)) << std::endl;
    }

    // Some history and stated preferences for one shopper.
    for (const char* id : {"3", "7", "11"}) {
        if (auto r = service->log_item_interaction("shopper", dataset::settings, id,
                                                   personalization::interaction_type::like); !r) {
            std::cerr << "Logging failed: [" << core::to_string(r.error().code) << "] " << r.error().message << std::endl;
            return 1;
        }
    }
    personalization::PreferenceMap prefs;
    prefs.metal = "rose gold";
    prefs.style = "vintage";
    prefs.price_range = std::make_pair(3000.0, 9000.0);
    if (auto r = service->update_preferences("shopper", prefs); !r) {
        std::cerr << "Preference update failed: [" << core::to_string(r.error().code) << "] " << r.error().message << std::endl;
        return 1;
    }

    search::RecommendRequest req;
    req.query = *query;
    req.query_text = "oval diamond in rose gold";
    req.top_k = 5;
    std::cout << "\nAnonymous combinations:" << std::endl;
    auto anon = service->recommend_combinations(req);
    if (!anon) {
        std::cerr << "Recommendation failed: [" << core::to_string(anon.error().code) << "] " << anon.error().message << std::endl;
        return 1;
    }
    print(*anon);

    req.user_id = "shopper";
    std::cout << "\nPersonalized combinations:" << std::endl;
    auto mine = service->recommend_combinations(req);
    if (!mine) {
        std::cerr << "Recommendation failed: [" << core::to_string(mine.error().code) << "] " << mine.error().message << std::endl;
        return 1;
    }
    print(*mine);

    const auto stats = service->stats();
    std::cout << "\npools built=" << stats.pool_builds << " users=" << stats.users << std::endl;
    return 0;
}
