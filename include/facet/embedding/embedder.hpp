#pragma once

/** \file embedder.hpp
 *  \brief Interface to the multimodal embedding model and query fusion.
 *
 * The model itself lives outside this library; callers inject an
 * implementation. Both modalities must map into the same D-dimensional
 * space as the pool embeddings.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "facet/error.hpp"

namespace facet::embedding {

class Embedder {
public:
    virtual ~Embedder() = default;

    /** \brief Embedding of \p text, or nullopt when the model cannot embed it. */
    virtual auto embed_text(std::string_view text) const -> std::optional<std::vector<float>> = 0;

    /** \brief Embedding of encoded image bytes, or nullopt on failure. */
    virtual auto embed_image(std::span<const std::uint8_t> bytes) const
        -> std::optional<std::vector<float>> = 0;

    /** \brief Output dimension D. */
    virtual auto dimension() const noexcept -> std::size_t = 0;
};

/** \brief Unit query vector from text, image or both.
 *
 * Each available modality is normalized; with both present the result is the
 * normalized 50/50 mean. Empty text or image bytes count as absent.
 * Errors: invalid_query when neither input yields a usable vector (absent,
 * embedder failure, zero norm or wrong dimension).
 */
auto embed_query(const Embedder& embedder,
                 std::optional<std::string_view> text,
                 std::optional<std::span<const std::uint8_t>> image)
    -> std::expected<std::vector<float>, core::error>;

} // namespace facet::embedding
