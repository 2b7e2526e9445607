#pragma once

/** \file config.hpp
 *  \brief Service configuration with FACET_* environment overrides.
 *
 * Environment variables (unset or empty leaves the field as is):
 *   FACET_DATA_DIR              pool files directory
 *   FACET_PROFILE_DIR           profile documents directory
 *   FACET_FLAT_THRESHOLD        pools below this size use exact search
 *   FACET_HNSW_M                HNSW out-degree
 *   FACET_HNSW_EF_CONSTRUCTION  HNSW build beam width
 *   FACET_HNSW_EF_SEARCH        HNSW query beam width
 *   FACET_HALF_LIFE_DAYS        interaction decay half-life
 *   FACET_DIVERSITY_WEIGHT      MMR lambda
 *   FACET_MAX_CANDIDATES        hits per pool for combinations
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>

#include "facet/error.hpp"
#include "facet/index/pool.hpp"
#include "facet/personalization/user_profile.hpp"
#include "facet/scoring/combination_scorer.hpp"
#include "facet/search/recommender.hpp"

namespace facet {

struct ServiceConfig {
    std::filesystem::path data_dir{"data"};
    std::optional<std::filesystem::path> profile_dir;     /**< in-memory profiles when unset */
    index::PoolBuildConfig pool{};
    scoring::ScoringWeights image_weights{scoring::ScoringWeights::image_preset()};
    scoring::ScoringWeights text_weights{scoring::ScoringWeights::text_preset()};
    personalization::PreferenceModelConfig preferences{};
    search::RecommenderConfig recommender{};
    std::size_t max_top_k{100};
};

/** \brief Apply FACET_* overrides on top of \p base.
 *  Errors: config_invalid for a value that does not parse.
 */
auto config_from_env(ServiceConfig base = {}) -> std::expected<ServiceConfig, core::error>;

/** \brief Range checks; config_invalid names the first offending field. */
auto validate(const ServiceConfig& config) -> std::expected<void, core::error>;

} // namespace facet
