#pragma once

/** \file profile_store.hpp
 *  \brief Thread-safe user profile store with per-user durable documents.
 *
 * Profiles are created lazily on the first preference update or interaction
 * and never destroyed. Every mutation is a read-modify-persist cycle
 * serialized per user id through a striped mutex table, so concurrent
 * updates of the same user never lose writes while different users proceed
 * in parallel. The in-memory profile only changes after the document has
 * been written; a failed write leaves the previous state in place.
 *
 * Document format ("facet-profile v1", native little-endian), one file per
 * user, replaced atomically (tmp + fsync + rename + directory fsync):
 *   u32 magic 'FPRF' | u32 version=1 | str user_id
 *   u8 has_pref [u64 dim | f32 * dim] | u8 has_text [str]
 *   u64 n_events, per event:
 *     u8 type | f32 weight | f64 timestamp | u64 dim | f32 * dim | u8 has_id [str]
 *   str = u64 length + bytes
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "facet/embedding/embedder.hpp"
#include "facet/error.hpp"
#include "facet/personalization/user_profile.hpp"

namespace facet::personalization {

struct ProfileStoreOptions {
    std::optional<std::filesystem::path> directory;   /**< no persistence when unset */
    PreferenceModelConfig model{};
    std::size_t stripes{64};                          /**< per-user lock stripes */
};

class UserProfileStore {
public:
    /** \param embedder used by update_preferences(); may be null when unused. */
    explicit UserProfileStore(ProfileStoreOptions options,
                              std::shared_ptr<const embedding::Embedder> embedder = nullptr);
    ~UserProfileStore();

    UserProfileStore(const UserProfileStore&) = delete;
    UserProfileStore& operator=(const UserProfileStore&) = delete;

    /** \brief Consistent copy of a profile, nullopt for unknown users. */
    auto get(std::string_view user_id) const -> std::optional<UserProfile>;

    /** \brief Hybrid vector at \p now (defaults to the wall clock). */
    auto user_vector(std::string_view user_id, std::optional<double> now = std::nullopt) const
        -> std::optional<std::vector<float>>;

    /** \brief Hybrid vectors of every user that has one. */
    auto all_vectors(std::optional<double> now = std::nullopt) const
        -> std::unordered_map<std::string, std::vector<float>>;

    auto user_ids() const -> std::vector<std::string>;
    auto size() const -> std::size_t;
    auto model() const noexcept -> const PreferenceModelConfig&;

    /** \brief Embed the synthesized preference text and store it normalized.
     *
     * Errors: invalid_argument for an empty user id; unavailable without an
     * embedder or when it cannot embed the text; io_failed when persisting.
     */
    auto update_preferences(std::string_view user_id, const PreferenceMap& prefs)
        -> std::expected<void, core::error>;

    /** \brief Append one interaction (normalized, log capped).
     *
     * Errors: invalid_argument for an empty user id or an embedding that is
     * empty, zero or not finite; io_failed when persisting.
     */
    auto log_interaction(std::string_view user_id, InteractionEvent event)
        -> std::expected<void, core::error>;

    /** \brief Initialize the preference vector as the similarity-weighted
     *  average of the given users' vectors.
     *
     * Users without a vector and non-positive similarities are skipped.
     * \return the new preference vector, nullopt when nothing contributed
     *         (the profile is then left unchanged).
     */
    auto seed_from_similar_users(std::string_view user_id,
                                 std::span<const std::pair<std::string, float>> similar)
        -> std::expected<std::optional<std::vector<float>>, core::error>;

    /** \brief Read every document in the directory, replacing in-memory state.
     *  \return number of profiles loaded. Errors: data_integrity on a corrupt document.
     */
    auto load_all() -> std::expected<std::size_t, core::error>;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Write \p p as "facet-profile v1" to \p path atomically. */
auto save_profile(const std::filesystem::path& path, const UserProfile& p)
    -> std::expected<void, core::error>;

/** \brief Read one "facet-profile v1" document. */
auto load_profile(const std::filesystem::path& path) -> std::expected<UserProfile, core::error>;

/** \brief File name of a user's document; unsafe characters are %XX escaped. */
auto profile_file_name(std::string_view user_id) -> std::string;

} // namespace facet::personalization
