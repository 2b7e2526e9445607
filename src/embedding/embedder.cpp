#include "facet/embedding/embedder.hpp"

#include <utility>

#include "facet/kernels/distance.hpp"

namespace facet::embedding {

namespace {

auto usable(std::optional<std::vector<float>> v, std::size_t dim) -> std::optional<std::vector<float>> {
    if (!v || v->empty() || v->size() != dim) return std::nullopt;
    if (!kernels::normalize(*v)) return std::nullopt;
    return v;
}

} // namespace

auto embed_query(const Embedder& embedder,
                 std::optional<std::string_view> text,
                 std::optional<std::span<const std::uint8_t>> image)
    -> std::expected<std::vector<float>, core::error> {
    const auto dim = embedder.dimension();
    std::optional<std::vector<float>> tv;
    std::optional<std::vector<float>> iv;
    if (text && !text->empty()) tv = usable(embedder.embed_text(*text), dim);
    if (image && !image->empty()) iv = usable(embedder.embed_image(*image), dim);

    if (tv && iv) return kernels::normalized_mean(*tv, *iv);
    if (tv) return std::move(*tv);
    if (iv) return std::move(*iv);
    return std::unexpected(core::error{core::error_code::invalid_query,
        "Query needs a text or image input that the embedder accepts", "embedding.query"});
}

} // namespace facet::embedding
