/** \file item.cpp
 *  \brief Item attribute accessors and "facet-meta v1" persistence.
 */

#include "facet/metadata/item.hpp"

#include <algorithm>
#include <fstream>
#include <type_traits>
#include <utility>

namespace facet::metadata {

namespace {
    constexpr std::uint32_t kMagic = 0x41544d46u; // "FMTA"
    constexpr std::uint32_t kVersion = 1;

    // Helpers for serialization of strings
    inline void write_string(std::ofstream& os, const std::string& s) {
        std::uint64_t n = static_cast<std::uint64_t>(s.size());
        os.write(reinterpret_cast<const char*>(&n), sizeof(n));
        os.write(s.data(), static_cast<std::streamsize>(s.size()));
    }

    inline bool read_string(std::ifstream& is, std::string& out) {
        std::uint64_t n{};
        if (!is.read(reinterpret_cast<char*>(&n), sizeof(n))) return false;
        if (n > (1ull << 30)) return false;
        out.resize(static_cast<std::size_t>(n));
        return static_cast<bool>(is.read(out.data(), static_cast<std::streamsize>(n)));
    }

    template <class T>
    inline void write_pod(std::ofstream& os, const T& v) {
        os.write(reinterpret_cast<const char*>(&v), sizeof(T));
    }

    template <class T>
    inline bool read_pod(std::ifstream& is, T& v) {
        return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
    }

    inline auto corrupt(const char* what) -> std::unexpected<core::error> {
        return std::unexpected(core::error{core::error_code::data_integrity, what, "metadata.load"});
    }

    auto find(const Item& item, std::string_view key) -> const AttributeValue* {
        auto it = item.attributes.find(std::string(key));
        return it == item.attributes.end() ? nullptr : &it->second;
    }
}

auto number(const Item& item, std::string_view key) -> std::optional<double> {
    const auto* v = find(item, key);
    if (!v) return std::nullopt;
    if (const auto* d = std::get_if<double>(v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(v)) return static_cast<double>(*i);
    return std::nullopt;
}

auto text(const Item& item, std::string_view key) -> std::optional<std::string> {
    const auto* v = find(item, key);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    return std::nullopt;
}

auto texts(const Item& item, std::string_view key) -> std::vector<std::string> {
    const auto* v = find(item, key);
    if (!v) return {};
    if (const auto* s = std::get_if<std::string>(v)) return {*s};
    if (const auto* l = std::get_if<std::vector<std::string>>(v)) return *l;
    return {};
}

auto price_or_zero(const Item& item) -> double {
    const auto p = number(item, attr::price);
    return (p && *p > 0.0) ? *p : 0.0;
}

auto save_items(const std::filesystem::path& path, std::span<const Item> items)
    -> std::expected<void, core::error> {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Failed to open file for writing", "metadata.save"});
    }
    write_pod(os, kMagic);
    write_pod(os, kVersion);
    write_pod(os, static_cast<std::uint64_t>(items.size()));
    for (const auto& item : items) {
        write_string(os, item.id);
        write_pod(os, static_cast<std::uint64_t>(item.attributes.size()));
        for (const auto& [k, v] : item.attributes) {
            write_string(os, k);
            const auto tag = static_cast<std::uint8_t>(v.index());
            write_pod(os, tag);
            std::visit([&os](const auto& val) {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    write_string(os, val);
                } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    write_pod(os, static_cast<std::uint64_t>(val.size()));
                    for (const auto& s : val) write_string(os, s);
                } else {
                    write_pod(os, val);
                }
            }, v);
        }
    }
    os.flush();
    if (!os) {
        return std::unexpected(core::error{core::error_code::io_failed, "Write failed", "metadata.save"});
    }
    return {};
}

auto load_items(const std::filesystem::path& path)
    -> std::expected<std::vector<Item>, core::error> {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        return std::unexpected(core::error{core::error_code::io_failed,
            "Failed to open metadata file " + path.string(), "metadata.load"});
    }
    std::uint32_t magic{}, version{};
    if (!read_pod(is, magic) || magic != kMagic) return corrupt("Corrupt header");
    if (!read_pod(is, version)) return corrupt("Corrupt header");
    if (version != kVersion) return corrupt("Unsupported version");
    std::uint64_t n_items{};
    if (!read_pod(is, n_items)) return corrupt("Corrupt count");

    std::vector<Item> items;
    items.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(n_items, 1u << 20)));
    for (std::uint64_t idx = 0; idx < n_items; ++idx) {
        Item item;
        if (!read_string(is, item.id)) return corrupt("Corrupt id");
        std::uint64_t n_attrs{};
        if (!read_pod(is, n_attrs)) return corrupt("Corrupt attr count");
        for (std::uint64_t j = 0; j < n_attrs; ++j) {
            std::string key;
            if (!read_string(is, key)) return corrupt("Corrupt key");
            std::uint8_t tag{};
            if (!read_pod(is, tag)) return corrupt("Corrupt type tag");
            switch (tag) {
                case 0: {
                    std::string s;
                    if (!read_string(is, s)) return corrupt("Corrupt string");
                    item.attributes.emplace(std::move(key), std::move(s));
                    break;
                }
                case 1: {
                    double val{};
                    if (!read_pod(is, val)) return corrupt("Corrupt double");
                    item.attributes.emplace(std::move(key), val);
                    break;
                }
                case 2: {
                    std::int64_t val{};
                    if (!read_pod(is, val)) return corrupt("Corrupt int64");
                    item.attributes.emplace(std::move(key), val);
                    break;
                }
                case 3: {
                    bool val{};
                    if (!read_pod(is, val)) return corrupt("Corrupt bool");
                    item.attributes.emplace(std::move(key), val);
                    break;
                }
                case 4: {
                    std::uint64_t n{};
                    if (!read_pod(is, n)) return corrupt("Corrupt list");
                    std::vector<std::string> list;
                    for (std::uint64_t li = 0; li < n; ++li) {
                        std::string s;
                        if (!read_string(is, s)) return corrupt("Corrupt list entry");
                        list.push_back(std::move(s));
                    }
                    item.attributes.emplace(std::move(key), std::move(list));
                    break;
                }
                default:
                    return corrupt("Unknown type tag");
            }
        }
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace facet::metadata
