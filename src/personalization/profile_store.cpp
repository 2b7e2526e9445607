/** \file profile_store.cpp
 *  \brief Striped-lock profile store and "facet-profile v1" documents.
 */

#include "facet/personalization/profile_store.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <shared_mutex>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "facet/core/platform_utils.hpp"
#include "facet/kernels/distance.hpp"

namespace facet::personalization {

namespace {

constexpr std::uint32_t kMagic = 0x46525046u; // "FPRF"
constexpr std::uint32_t kVersion = 1;
constexpr std::string_view kExtension = ".profile";

void write_string(std::ofstream& os, const std::string& s) {
    std::uint64_t n = static_cast<std::uint64_t>(s.size());
    os.write(reinterpret_cast<const char*>(&n), sizeof(n));
    os.write(s.data(), static_cast<std::streamsize>(s.size()));
}

bool read_string(std::ifstream& is, std::string& out) {
    std::uint64_t n{};
    if (!is.read(reinterpret_cast<char*>(&n), sizeof(n))) return false;
    if (n > (1ull << 30)) return false;
    out.resize(static_cast<std::size_t>(n));
    return static_cast<bool>(is.read(out.data(), static_cast<std::streamsize>(n)));
}

template <class T>
void write_pod(std::ofstream& os, const T& v) {
    os.write(reinterpret_cast<const char*>(&v), sizeof(T));
}

template <class T>
bool read_pod(std::ifstream& is, T& v) {
    return static_cast<bool>(is.read(reinterpret_cast<char*>(&v), sizeof(T)));
}

void write_vector(std::ofstream& os, const std::vector<float>& v) {
    write_pod(os, static_cast<std::uint64_t>(v.size()));
    os.write(reinterpret_cast<const char*>(v.data()), static_cast<std::streamsize>(v.size() * sizeof(float)));
}

bool read_vector(std::ifstream& is, std::vector<float>& v) {
    std::uint64_t n{};
    if (!read_pod(is, n) || n > (1ull << 24)) return false;
    v.resize(static_cast<std::size_t>(n));
    return static_cast<bool>(is.read(reinterpret_cast<char*>(v.data()),
                                     static_cast<std::streamsize>(n * sizeof(float))));
}

auto corrupt(const std::filesystem::path& p, const char* what) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::data_integrity,
        std::string(what) + " in " + p.string(), "profile.load"});
}

auto io_error(const char* what) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::io_failed, what, "profile.save"});
}

// Flush a file or directory to stable storage; best effort for directories.
bool sync_path(const std::filesystem::path& p) {
#if defined(__linux__) || defined(__APPLE__)
    int fd = ::open(p.string().c_str(), O_RDONLY);
    if (fd < 0) return false;
    (void)::fsync(fd);
    (void)::close(fd);
#else
    (void)p;
#endif
    return true;
}

auto valid_embedding(std::vector<float>& v) -> bool {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return !v.empty() && kernels::normalize(v);
}

} // namespace

auto profile_file_name(std::string_view user_id) -> std::string {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : user_id) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        }
    }
    // Leading dots would make hidden files or "." / "..".
    if (!out.empty() && out.front() == '.') out.replace(0, 1, "%2E");
    out.append(kExtension);
    return out;
}

auto save_profile(const std::filesystem::path& path, const UserProfile& p)
    -> std::expected<void, core::error> {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os) return io_error("profile tmp open failed");
        write_pod(os, kMagic);
        write_pod(os, kVersion);
        write_string(os, p.user_id);
        write_pod(os, static_cast<std::uint8_t>(p.preference.has_value()));
        if (p.preference) write_vector(os, *p.preference);
        write_pod(os, static_cast<std::uint8_t>(p.preference_text.has_value()));
        if (p.preference_text) write_string(os, *p.preference_text);
        write_pod(os, static_cast<std::uint64_t>(p.interactions.size()));
        for (const auto& e : p.interactions) {
            write_pod(os, static_cast<std::uint8_t>(e.type));
            write_pod(os, e.weight);
            write_pod(os, e.timestamp);
            write_vector(os, e.embedding);
            write_pod(os, static_cast<std::uint8_t>(e.item_id.has_value()));
            if (e.item_id) write_string(os, *e.item_id);
        }
        os.flush();
        if (!os) {
            std::error_code rec;
            (void)std::filesystem::remove(tmp, rec);
            return io_error("profile tmp write failed");
        }
    }
    if (!sync_path(tmp)) {
        std::error_code rec;
        (void)std::filesystem::remove(tmp, rec);
        return io_error("profile tmp fsync open failed");
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        (void)std::filesystem::remove(tmp, ec);
        return io_error("profile rename failed");
    }
    (void)sync_path(path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path());
    return {};
}

auto load_profile(const std::filesystem::path& path) -> std::expected<UserProfile, core::error> {
    std::ifstream is(path, std::ios::binary);
    if (!is) {
        return std::unexpected(core::error{core::error_code::io_failed,
            "Failed to open profile " + path.string(), "profile.load"});
    }
    std::uint32_t magic{}, version{};
    if (!read_pod(is, magic) || magic != kMagic) return corrupt(path, "Bad profile header");
    if (!read_pod(is, version) || version != kVersion) return corrupt(path, "Unsupported profile version");

    UserProfile p;
    if (!read_string(is, p.user_id)) return corrupt(path, "Corrupt user id");
    std::uint8_t flag{};
    if (!read_pod(is, flag)) return corrupt(path, "Corrupt preference flag");
    if (flag) {
        std::vector<float> v;
        if (!read_vector(is, v)) return corrupt(path, "Corrupt preference vector");
        p.preference = std::move(v);
    }
    if (!read_pod(is, flag)) return corrupt(path, "Corrupt text flag");
    if (flag) {
        std::string s;
        if (!read_string(is, s)) return corrupt(path, "Corrupt preference text");
        p.preference_text = std::move(s);
    }
    std::uint64_t n{};
    if (!read_pod(is, n)) return corrupt(path, "Corrupt interaction count");
    for (std::uint64_t i = 0; i < n; ++i) {
        InteractionEvent e;
        std::uint8_t type{};
        if (!read_pod(is, type) || type > static_cast<std::uint8_t>(interaction_type::purchase)) {
            return corrupt(path, "Corrupt interaction type");
        }
        e.type = static_cast<interaction_type>(type);
        if (!read_pod(is, e.weight) || !read_pod(is, e.timestamp)) return corrupt(path, "Corrupt interaction");
        if (!read_vector(is, e.embedding)) return corrupt(path, "Corrupt interaction embedding");
        if (!read_pod(is, flag)) return corrupt(path, "Corrupt item id flag");
        if (flag) {
            std::string id;
            if (!read_string(is, id)) return corrupt(path, "Corrupt item id");
            e.item_id = std::move(id);
        }
        p.interactions.push_back(std::move(e));
    }
    return p;
}

class UserProfileStore::Impl {
public:
    Impl(ProfileStoreOptions options, std::shared_ptr<const embedding::Embedder> embedder)
        : options_(std::move(options)),
          embedder_(std::move(embedder)),
          stripes_(options_.stripes == 0 ? 1 : options_.stripes) {}

    auto stripe(std::string_view user_id) const -> std::mutex& {
        return stripes_[std::hash<std::string_view>{}(user_id) % stripes_.size()];
    }

    auto find(std::string_view user_id) const -> std::shared_ptr<UserProfile> {
        std::shared_lock lock(map_mutex_);
        auto it = profiles_.find(std::string(user_id));
        return it == profiles_.end() ? nullptr : it->second;
    }

    // Caller holds the user's stripe. Returns the current profile or a fresh
    // one that is only published by commit().
    auto current(std::string_view user_id) const -> UserProfile {
        if (auto p = find(user_id)) return *p;
        UserProfile fresh;
        fresh.user_id = std::string(user_id);
        return fresh;
    }

    // Caller holds the user's stripe.
    auto commit(UserProfile next) -> std::expected<void, core::error> {
        if (options_.directory) {
            std::error_code ec;
            std::filesystem::create_directories(*options_.directory, ec);
            if (ec) {
                return std::unexpected(core::error{core::error_code::io_failed,
                    "Cannot create profile directory " + options_.directory->string(), "profile.save"});
            }
            auto saved = save_profile(*options_.directory / profile_file_name(next.user_id), next);
            if (!saved) return saved;
        }
        auto fresh = std::make_shared<UserProfile>(std::move(next));
        std::unique_lock lock(map_mutex_);
        profiles_[fresh->user_id] = std::move(fresh);
        return {};
    }

    ProfileStoreOptions options_;
    std::shared_ptr<const embedding::Embedder> embedder_;
    mutable std::vector<std::mutex> stripes_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<UserProfile>> profiles_;
};

UserProfileStore::UserProfileStore(ProfileStoreOptions options,
                                   std::shared_ptr<const embedding::Embedder> embedder)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(embedder))) {}

UserProfileStore::~UserProfileStore() = default;

auto UserProfileStore::get(std::string_view user_id) const -> std::optional<UserProfile> {
    std::lock_guard<std::mutex> lock(impl_->stripe(user_id));
    if (auto p = impl_->find(user_id)) return *p;
    return std::nullopt;
}

auto UserProfileStore::user_vector(std::string_view user_id, std::optional<double> now) const
    -> std::optional<std::vector<float>> {
    auto p = get(user_id);
    if (!p) return std::nullopt;
    return hybrid_vector(*p, now.value_or(now_seconds()), impl_->options_.model);
}

auto UserProfileStore::all_vectors(std::optional<double> now) const
    -> std::unordered_map<std::string, std::vector<float>> {
    const double t = now.value_or(now_seconds());
    std::unordered_map<std::string, std::vector<float>> out;
    for (const auto& id : user_ids()) {
        if (auto v = user_vector(id, t)) out.emplace(id, std::move(*v));
    }
    return out;
}

auto UserProfileStore::user_ids() const -> std::vector<std::string> {
    std::shared_lock lock(impl_->map_mutex_);
    std::vector<std::string> ids;
    ids.reserve(impl_->profiles_.size());
    for (const auto& [id, _] : impl_->profiles_) ids.push_back(id);
    return ids;
}

auto UserProfileStore::size() const -> std::size_t {
    std::shared_lock lock(impl_->map_mutex_);
    return impl_->profiles_.size();
}

auto UserProfileStore::model() const noexcept -> const PreferenceModelConfig& {
    return impl_->options_.model;
}

auto UserProfileStore::update_preferences(std::string_view user_id, const PreferenceMap& prefs)
    -> std::expected<void, core::error> {
    if (user_id.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "Empty user id", "profile.preferences"});
    }
    if (!impl_->embedder_) {
        return std::unexpected(core::error{core::error_code::unavailable, "No embedder configured", "profile.preferences"});
    }
    auto text = preference_text(prefs);
    auto vec = impl_->embedder_->embed_text(text);
    if (!vec || !valid_embedding(*vec)) {
        return std::unexpected(core::error{core::error_code::unavailable,
            "Embedder could not embed preference text", "profile.preferences"});
    }

    std::lock_guard<std::mutex> lock(impl_->stripe(user_id));
    auto next = impl_->current(user_id);
    next.preference = std::move(*vec);
    next.preference_text = std::move(text);
    if (core::debug_enabled()) {
        std::cerr << "[PROFILE][preferences] user=" << user_id << " text=\"" << *next.preference_text << "\"" << std::endl;
    }
    return impl_->commit(std::move(next));
}

auto UserProfileStore::log_interaction(std::string_view user_id, InteractionEvent event)
    -> std::expected<void, core::error> {
    if (user_id.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "Empty user id", "profile.interaction"});
    }
    if (!valid_embedding(event.embedding)) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "Interaction embedding is empty, zero or not finite", "profile.interaction"});
    }
    if (!std::isfinite(event.weight) || event.weight < 0.0f) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "Interaction weight must be finite and non-negative", "profile.interaction"});
    }

    std::lock_guard<std::mutex> lock(impl_->stripe(user_id));
    auto next = impl_->current(user_id);
    if (!next.interactions.empty() && next.interactions.front().embedding.size() != event.embedding.size()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "Interaction embedding dimension differs from the user's history", "profile.interaction"});
    }
    append_interaction(next, std::move(event), impl_->options_.model);
    if (core::debug_enabled()) {
        const auto& e = next.interactions.back();
        std::cerr << "[PROFILE][interaction] user=" << user_id << " type=" << to_string(e.type)
                  << " item=" << e.item_id.value_or("-") << " log=" << next.interactions.size() << std::endl;
    }
    return impl_->commit(std::move(next));
}

auto UserProfileStore::seed_from_similar_users(std::string_view user_id,
                                               std::span<const std::pair<std::string, float>> similar)
    -> std::expected<std::optional<std::vector<float>>, core::error> {
    if (user_id.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument, "Empty user id", "profile.seed"});
    }
    const double now = now_seconds();
    std::vector<float> acc;
    double total = 0.0;
    for (const auto& [other, sim] : similar) {
        if (other == user_id || !(sim > 0.0f)) continue;
        auto v = user_vector(other, now);
        if (!v) continue;
        if (acc.empty()) acc.assign(v->size(), 0.0f);
        if (v->size() != acc.size()) continue;
        kernels::axpy(sim, *v, acc);
        total += sim;
    }
    if (acc.empty() || !(total > 0.0) || !kernels::normalize(acc)) return std::optional<std::vector<float>>{};

    std::lock_guard<std::mutex> lock(impl_->stripe(user_id));
    auto next = impl_->current(user_id);
    next.preference = acc;
    if (auto r = impl_->commit(std::move(next)); !r) return std::unexpected(r.error());
    return std::optional<std::vector<float>>{std::move(acc)};
}

auto UserProfileStore::load_all() -> std::expected<std::size_t, core::error> {
    if (!impl_->options_.directory) return std::size_t{0};
    const auto& dir = *impl_->options_.directory;
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) return std::size_t{0};

    std::unordered_map<std::string, std::shared_ptr<UserProfile>> loaded;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kExtension) continue;
        auto p = load_profile(entry.path());
        if (!p) return std::unexpected(p.error());
        auto id = p->user_id;
        loaded[std::move(id)] = std::make_shared<UserProfile>(std::move(*p));
    }
    if (ec) {
        return std::unexpected(core::error{core::error_code::io_failed,
            "Cannot list profile directory " + dir.string(), "profile.load"});
    }
    const auto n = loaded.size();
    {
        std::unique_lock lock(impl_->map_mutex_);
        impl_->profiles_ = std::move(loaded);
    }
    if (core::debug_enabled()) {
        std::cerr << "[PROFILE][load] " << n << " profiles from " << dir.string() << std::endl;
    }
    return n;
}

} // namespace facet::personalization
