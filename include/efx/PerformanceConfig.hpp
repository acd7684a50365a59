#pragma once

#include <cstdint>
#include <expected>
#include <string>

namespace efx {

/**
 * @brief Camera distances at which particle systems degrade
 *
 * Inside near: full quality. Between near and medium: reduced. Beyond far: no particles.
 */
struct LodDistances {
    float near;
    float medium;
    float far;

    friend constexpr bool operator==(const LodDistances&, const LodDistances&) = default;
};

struct ParticleSettings {
    bool enable_lod;
    uint32_t max_particles_per_system;
    uint32_t max_active_systems;
    LodDistances lod_distances;

    friend constexpr bool operator==(const ParticleSettings&, const ParticleSettings&) = default;
};

struct RenderingSettings {
    uint32_t max_draw_calls;
    bool enable_frustum_culling;
    uint32_t shadow_map_size;
    bool antialias;

    friend constexpr bool operator==(const RenderingSettings&, const RenderingSettings&) = default;
};

struct EffectSettings {
    bool enable_smoke_trails;
    bool enable_ground_effects;
    bool enable_debris;
    uint32_t effect_pool_size;

    friend constexpr bool operator==(const EffectSettings&, const EffectSettings&) = default;
};

/**
 * @brief Complete configuration consumed by the particle and effect subsystems
 *
 * Exactly one bundle is current in the render loop. It is always replaced as a
 * whole, never edited field by field.
 */
struct PerformanceBundle {
    ParticleSettings particles;
    RenderingSettings rendering;
    EffectSettings effects;

    friend constexpr bool operator==(const PerformanceBundle&, const PerformanceBundle&) = default;
};

/// Full-quality configuration, also returned by the controller at high frame rates
inline constexpr PerformanceBundle DEFAULT_PERFORMANCE_BUNDLE{
    .particles = {
        .enable_lod = true,
        .max_particles_per_system = 100,
        .max_active_systems = 20,
        .lod_distances = {.near = 50.0f, .medium = 100.0f, .far = 200.0f}
    },
    .rendering = {
        .max_draw_calls = 150,
        .enable_frustum_culling = true,
        .shadow_map_size = 1024,
        .antialias = true
    },
    .effects = {
        .enable_smoke_trails = true,
        .enable_ground_effects = true,
        .enable_debris = true,
        .effect_pool_size = 50
    }
};

/**
 * @brief Check the ordering of LOD bands
 * @return void when 0 <= near < medium < far, error message otherwise
 */
[[nodiscard]] std::expected<void, std::string> validate(const LodDistances& distances);

/**
 * @brief Check LOD ordering, system limits and shadow map size of a bundle
 */
[[nodiscard]] std::expected<void, std::string> validate(const PerformanceBundle& bundle);

} // namespace efx
