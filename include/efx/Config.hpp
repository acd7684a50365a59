#pragma once

#include "Common.hpp"
#include "PerformanceConfig.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace efx {

/**
 * @brief Host-side configuration for the effects core
 */
struct EffectsConfig {
    QualityTier geometry_tier = DEFAULT_QUALITY_TIER;            ///< Default tier for geometry lookups
    PerformanceBundle initial_bundle = DEFAULT_PERFORMANCE_BUNDLE;  ///< Bundle in effect before the first FPS sample
    uint32_t trail_max_points = 128;                              ///< Points allocated per trail
};

/**
 * @brief Parse a tier name ("high", "medium", "low", "minimal"), ignoring case
 * @return Tier on success, error message naming the rejected input otherwise
 */
[[nodiscard]] std::expected<QualityTier, std::string> parse_quality_tier(std::string_view name);

/**
 * @brief Reject configurations the core cannot run with
 */
[[nodiscard]] std::expected<void, std::string> validate(const EffectsConfig& config);

} // namespace efx
