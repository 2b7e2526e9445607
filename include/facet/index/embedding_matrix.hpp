#pragma once

/** \file embedding_matrix.hpp
 *  \brief Row-major float32 embedding matrix and its file formats.
 *
 * Two on-disk formats are accepted:
 * - "facet-emb v1": u32 magic 'FEMB' | u32 version=1 | u64 rows | u64 dim |
 *   rows*dim float32 (native little-endian).
 * - NumPy .npy (format 1.0/2.0/3.0), dtype '<f4' or '<f8', C order, 2-D.
 *
 * load_embeddings() dispatches on the ".npy" extension.
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

#include "facet/error.hpp"

namespace facet::index {

struct EmbeddingMatrix {
    std::size_t rows{0};
    std::size_t dim{0};
    std::vector<float> data;   /**< rows * dim, row-major */

    auto row(std::size_t i) const noexcept -> std::span<const float> {
        return {data.data() + i * dim, dim};
    }
    auto row(std::size_t i) noexcept -> std::span<float> {
        return {data.data() + i * dim, dim};
    }
};

/** \brief Build a matrix from row vectors; all rows must share one non-zero dimension. */
auto make_matrix(const std::vector<std::vector<float>>& rows)
    -> std::expected<EmbeddingMatrix, core::error>;

/** \brief Load a matrix from ".npy" or "facet-emb v1".
 *
 * Errors: io_failed when the file cannot be opened; data_integrity on a bad
 * header, unsupported dtype/order/rank or short payload.
 */
auto load_embeddings(const std::filesystem::path& path)
    -> std::expected<EmbeddingMatrix, core::error>;

auto save_embeddings(const std::filesystem::path& path, const EmbeddingMatrix& m)
    -> std::expected<void, core::error>;

/** \brief Write a NumPy v1.0 '<f4' array. */
auto save_npy(const std::filesystem::path& path, const EmbeddingMatrix& m)
    -> std::expected<void, core::error>;

} // namespace facet::index
