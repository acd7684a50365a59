#pragma once

#include "PerformanceConfig.hpp"
#include <cstdint>
#include <string_view>
#include <variant>

namespace efx {

/**
 * @brief Frame-rate bands the controller discretizes into
 */
enum class QualityLevel : uint8_t {
    Low,     ///< fps < 30 (also negative and NaN samples)
    Medium,  ///< 30 <= fps < 45
    High     ///< fps >= 45
};

[[nodiscard]] std::string_view to_string(QualityLevel level);

inline constexpr double LOW_QUALITY_FPS_THRESHOLD = 30.0;
inline constexpr double HIGH_QUALITY_FPS_THRESHOLD = 45.0;

/**
 * @brief Partial configuration produced below the high band
 *
 * Carries only particle and effect settings. Rendering settings are not adjusted
 * below the high band: merging an override keeps the rendering block of the bundle
 * it is applied to.
 */
struct QualityOverride {
    QualityLevel level;
    ParticleSettings particles;
    EffectSettings effects;

    friend constexpr bool operator==(const QualityOverride&, const QualityOverride&) = default;
};

inline constexpr QualityOverride LOW_QUALITY_OVERRIDE{
    .level = QualityLevel::Low,
    .particles = {
        .enable_lod = true,
        .max_particles_per_system = 50,
        .max_active_systems = 10,
        .lod_distances = {.near = 30.0f, .medium = 60.0f, .far = 100.0f}
    },
    .effects = {
        .enable_smoke_trails = false,
        .enable_ground_effects = false,
        .enable_debris = false,
        .effect_pool_size = 20
    }
};

inline constexpr QualityOverride MEDIUM_QUALITY_OVERRIDE{
    .level = QualityLevel::Medium,
    .particles = {
        .enable_lod = true,
        .max_particles_per_system = 75,
        .max_active_systems = 15,
        .lod_distances = {.near = 40.0f, .medium = 80.0f, .far = 150.0f}
    },
    .effects = {
        .enable_smoke_trails = true,
        .enable_ground_effects = false,
        .enable_debris = true,
        .effect_pool_size = 30
    }
};

/// Either the full default bundle (high band) or an override (low and medium bands)
using QualitySettings = std::variant<PerformanceBundle, QualityOverride>;

/**
 * @brief Map an FPS sample to its quality band
 *
 * Thresholds are lower-inclusive: 30 is medium, 45 is high. Negative and NaN
 * samples are treated as low; positive infinity is high.
 */
[[nodiscard]] QualityLevel classify_frame_rate(double fps);

/**
 * @brief Derive the configuration for a single FPS sample
 *
 * Stateless and total. No smoothing is applied; every call is independent.
 */
[[nodiscard]] QualitySettings get_quality_settings(double fps);

/**
 * @brief Band a settings value was produced for
 */
[[nodiscard]] QualityLevel level_of(const QualitySettings& settings);

/**
 * @brief Merge controller output onto the current bundle
 *
 * A full bundle replaces @p current entirely. An override replaces particles and
 * effects and keeps current.rendering.
 *
 * @return The new bundle to install as current
 */
[[nodiscard]] PerformanceBundle apply_quality_settings(const PerformanceBundle& current,
                                                       const QualitySettings& settings);

} // namespace efx
