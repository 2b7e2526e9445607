#include "facet/index/flat_index.hpp"

#include <algorithm>

#include "facet/kernels/distance.hpp"

namespace facet::index {

auto flat_search(const EmbeddingMatrix& m, std::span<const float> query, std::size_t k,
                 const roaring::Roaring* restrict_to) -> std::vector<ScoredRow> {
    std::vector<ScoredRow> out;
    if (k == 0 || m.rows == 0) return out;

    if (restrict_to) {
        out.reserve(static_cast<std::size_t>(restrict_to->cardinality()));
        for (auto it = restrict_to->begin(); it != restrict_to->end(); ++it) {
            const std::uint32_t pos = *it;
            if (pos >= m.rows) break;
            out.push_back({pos, kernels::inner_product(query, m.row(pos))});
        }
    } else {
        out.reserve(m.rows);
        for (std::size_t i = 0; i < m.rows; ++i) {
            out.push_back({static_cast<std::uint32_t>(i), kernels::inner_product(query, m.row(i))});
        }
    }

    if (out.size() > k) {
        auto kth = out.begin() + static_cast<std::ptrdiff_t>(k);
        std::nth_element(out.begin(), kth, out.end(), ranks_before);
        out.resize(k);
    }
    std::sort(out.begin(), out.end(), ranks_before);
    return out;
}

} // namespace facet::index
