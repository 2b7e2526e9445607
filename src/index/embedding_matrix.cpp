/** \file embedding_matrix.cpp
 *  \brief facet-emb v1 and NumPy .npy readers/writers.
 */

#include "facet/index/embedding_matrix.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace facet::index {

namespace {
    constexpr std::uint32_t kMagic = 0x424d4546u; // "FEMB"
    constexpr std::uint32_t kVersion = 1;
    constexpr char kNpyMagic[] = "\x93NUMPY";

    inline auto corrupt(std::string what) -> std::unexpected<core::error> {
        return std::unexpected(core::error{core::error_code::data_integrity, std::move(what), "embeddings.load"});
    }

    template <class T>
    inline bool read_pod(std::ifstream& is, T& v) {
        return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
    }

    // Bytes between the read position and the end of the stream.
    auto remaining_bytes(std::ifstream& is) -> std::uint64_t {
        const auto here = is.tellg();
        if (here < 0) return 0;
        is.seekg(0, std::ios::end);
        const auto end = is.tellg();
        is.seekg(here);
        if (end < here) return 0;
        return static_cast<std::uint64_t>(end - here);
    }

    // Header shape must be non-degenerate, addressable and backed by the file.
    auto check_shape(std::ifstream& is, std::uint64_t rows, std::uint64_t dim, std::size_t elem_size)
        -> std::expected<void, core::error> {
        constexpr auto kMax = std::numeric_limits<std::size_t>::max();
        if (dim == 0) return corrupt("Zero embedding dimension");
        if (rows > kMax / dim) return corrupt("Embedding shape overflows");
        const auto count = static_cast<std::size_t>(rows * dim);
        if (count > kMax / elem_size || count > kMax / sizeof(float)) {
            return corrupt("Embedding shape overflows");
        }
        const auto avail = remaining_bytes(is);
        if (count * elem_size > avail) {
            return corrupt("Embedding header claims " + std::to_string(count * elem_size) +
                           " bytes, file has " + std::to_string(avail));
        }
        return {};
    }

    // Value of a key in the npy header dict, e.g. 'descr': '<f4' -> "'<f4'".
    auto header_value(std::string_view header, std::string_view key) -> std::string_view {
        const auto k = header.find(key);
        if (k == std::string_view::npos) return {};
        auto rest = header.substr(k + key.size());
        const auto colon = rest.find(':');
        if (colon == std::string_view::npos) return {};
        rest.remove_prefix(colon + 1);
        while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
        if (rest.empty()) return {};
        const char open = rest.front();
        if (open == '(') {
            const auto close = rest.find(')');
            return close == std::string_view::npos ? std::string_view{} : rest.substr(0, close + 1);
        }
        if (open == '\'' || open == '"') {
            const auto close = rest.find(open, 1);
            return close == std::string_view::npos ? std::string_view{} : rest.substr(0, close + 1);
        }
        const auto end = rest.find_first_of(",}");
        return rest.substr(0, end);
    }

    auto parse_shape(std::string_view tuple, std::size_t& rows, std::size_t& dim) -> bool {
        // "(rows, dim)" with optional trailing comma/spaces
        std::size_t vals[2]{};
        int count = 0;
        std::uint64_t cur = 0;
        bool in_num = false;
        for (char c : tuple) {
            if (c >= '0' && c <= '9') {
                if (cur > (std::numeric_limits<std::uint64_t>::max() - 9) / 10) return false;
                cur = cur * 10 + static_cast<std::uint64_t>(c - '0');
                in_num = true;
            } else if (in_num) {
                if (count >= 2) return false;
                vals[count++] = static_cast<std::size_t>(cur);
                cur = 0;
                in_num = false;
            }
        }
        if (count != 2) return false;
        rows = vals[0];
        dim = vals[1];
        return true;
    }

    auto load_npy(std::ifstream& is) -> std::expected<EmbeddingMatrix, core::error> {
        char magic[6];
        if (!is.read(magic, 6) || std::memcmp(magic, kNpyMagic, 6) != 0) return corrupt("Bad npy magic");
        std::uint8_t major{}, minor{};
        if (!read_pod(is, major) || !read_pod(is, minor)) return corrupt("Corrupt npy version");
        std::uint32_t header_len{};
        if (major == 1) {
            std::uint16_t h16{};
            if (!read_pod(is, h16)) return corrupt("Corrupt npy header length");
            header_len = h16;
        } else if (major == 2 || major == 3) {
            if (!read_pod(is, header_len)) return corrupt("Corrupt npy header length");
        } else {
            return corrupt("Unsupported npy version " + std::to_string(major));
        }
        std::string header(header_len, '\0');
        if (!is.read(header.data(), header_len)) return corrupt("Truncated npy header");

        const auto descr = header_value(header, "'descr'");
        const bool f4 = descr == "'<f4'";
        const bool f8 = descr == "'<f8'";
        if (!f4 && !f8) return corrupt("Unsupported npy dtype " + std::string(descr));
        if (header_value(header, "'fortran_order'") != "False") return corrupt("Fortran-order npy not supported");

        EmbeddingMatrix m;
        if (!parse_shape(header_value(header, "'shape'"), m.rows, m.dim)) return corrupt("npy array must be 2-D");
        if (auto ok = check_shape(is, m.rows, m.dim, f4 ? sizeof(float) : sizeof(double)); !ok) {
            return std::unexpected(ok.error());
        }
        m.data.resize(m.rows * m.dim);
        if (f4) {
            if (!is.read(reinterpret_cast<char*>(m.data.data()),
                         static_cast<std::streamsize>(m.data.size() * sizeof(float)))) {
                return corrupt("Truncated npy payload");
            }
        } else {
            std::vector<double> tmp(m.data.size());
            if (!is.read(reinterpret_cast<char*>(tmp.data()),
                         static_cast<std::streamsize>(tmp.size() * sizeof(double)))) {
                return corrupt("Truncated npy payload");
            }
            for (std::size_t i = 0; i < tmp.size(); ++i) m.data[i] = static_cast<float>(tmp[i]);
        }
        return m;
    }

    auto load_native(std::ifstream& is) -> std::expected<EmbeddingMatrix, core::error> {
        std::uint32_t magic{}, version{};
        if (!read_pod(is, magic) || magic != kMagic) return corrupt("Corrupt header");
        if (!read_pod(is, version) || version != kVersion) return corrupt("Unsupported version");
        std::uint64_t rows{}, dim{};
        if (!read_pod(is, rows) || !read_pod(is, dim)) return corrupt("Corrupt shape");
        if (auto ok = check_shape(is, rows, dim, sizeof(float)); !ok) return std::unexpected(ok.error());
        EmbeddingMatrix m;
        m.rows = static_cast<std::size_t>(rows);
        m.dim = static_cast<std::size_t>(dim);
        m.data.resize(m.rows * m.dim);
        if (!is.read(reinterpret_cast<char*>(m.data.data()),
                     static_cast<std::streamsize>(m.data.size() * sizeof(float)))) {
            return corrupt("Truncated payload");
        }
        return m;
    }
}

auto make_matrix(const std::vector<std::vector<float>>& rows)
    -> std::expected<EmbeddingMatrix, core::error> {
    EmbeddingMatrix m;
    m.rows = rows.size();
    m.dim = rows.empty() ? 0 : rows.front().size();
    if (m.rows > 0 && m.dim == 0) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "Zero-dimensional rows", "embeddings"});
    }
    m.data.reserve(m.rows * m.dim);
    for (const auto& r : rows) {
        if (r.size() != m.dim) {
            return std::unexpected(core::error{core::error_code::invalid_argument, "Ragged rows", "embeddings"});
        }
        m.data.insert(m.data.end(), r.begin(), r.end());
    }
    return m;
}

auto load_embeddings(const std::filesystem::path& path)
    -> std::expected<EmbeddingMatrix, core::error> {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        return std::unexpected(core::error{core::error_code::io_failed,
            "Failed to open embeddings file " + path.string(), "embeddings.load"});
    }
    if (path.extension() == ".npy") return load_npy(is);
    return load_native(is);
}

auto save_embeddings(const std::filesystem::path& path, const EmbeddingMatrix& m)
    -> std::expected<void, core::error> {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Failed to open file for writing", "embeddings.save"});
    }
    const std::uint64_t rows = m.rows, dim = m.dim;
    os.write(reinterpret_cast<const char*>(&kMagic), sizeof(kMagic));
    os.write(reinterpret_cast<const char*>(&kVersion), sizeof(kVersion));
    os.write(reinterpret_cast<const char*>(&rows), sizeof(rows));
    os.write(reinterpret_cast<const char*>(&dim), sizeof(dim));
    os.write(reinterpret_cast<const char*>(m.data.data()),
             static_cast<std::streamsize>(m.data.size() * sizeof(float)));
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Write failed", "embeddings.save"});
    }
    return {};
}

auto save_npy(const std::filesystem::path& path, const EmbeddingMatrix& m)
    -> std::expected<void, core::error> {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Failed to open file for writing", "embeddings.save"});
    }
    std::string header = "{'descr': '<f4', 'fortran_order': False, 'shape': (" +
        std::to_string(m.rows) + ", " + std::to_string(m.dim) + "), }";
    // magic(6) + version(2) + len(2) + header + '\n' padded to 64 bytes
    const std::size_t unpadded = 10 + header.size() + 1;
    header.append((64 - unpadded % 64) % 64, ' ');
    header.push_back('\n');
    const std::uint8_t ver[2] = {1, 0};
    const auto len = static_cast<std::uint16_t>(header.size());
    os.write(kNpyMagic, 6);
    os.write(reinterpret_cast<const char*>(ver), 2);
    os.write(reinterpret_cast<const char*>(&len), sizeof(len));
    os.write(header.data(), static_cast<std::streamsize>(header.size()));
    os.write(reinterpret_cast<const char*>(m.data.data()),
             static_cast<std::streamsize>(m.data.size() * sizeof(float)));
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Write failed", "embeddings.save"});
    }
    return {};
}

} // namespace facet::index
