#pragma once

#include "Common.hpp"
#include <array>
#include <cstdint>
#include <optional>

namespace efx {

/**
 * @brief Subdivision counts for a UV sphere
 */
struct SegmentSpec {
    uint32_t width_segments;   ///< Segments around the azimuth (phi)
    uint32_t height_segments;  ///< Segments from pole to pole (theta)

    friend constexpr bool operator==(const SegmentSpec&, const SegmentSpec&) = default;
};

/**
 * @brief Angular extent of a sphere, in radians
 *
 * phi sweeps around the vertical axis, theta runs from the north pole (0) down to the south pole (pi).
 */
struct SphereSweep {
    float phi_start = 0.0f;
    float phi_length = glm::two_pi<float>();
    float theta_start = 0.0f;
    float theta_length = glm::pi<float>();

    friend constexpr bool operator==(const SphereSweep&, const SphereSweep&) = default;
};

/**
 * @brief Named sphere shape bound to the segment counts of a fixed tier
 */
struct SpherePreset {
    float radius;
    QualityTier tier;
    SegmentSpec segments;
    SphereSweep sweep;
};

/**
 * @brief Immutable mapping from quality tier to primitive segment counts
 *
 * The tier arrays are filled first and the named presets are then derived from
 * them by value, so a table never refers back into itself after construction.
 * Lookups are pure; a table can be shared freely once built.
 *
 * Preset tiers are fixed per use case and do not follow the table default:
 * - radar dome: few and large, medium tier, upper hemisphere only
 * - explosion sphere: large but short-lived, low tier
 * - projectile sphere: small and numerous, minimal tier
 */
class GeometryTierTable {
public:
    static constexpr float RADAR_DOME_RADIUS = 4.0f;
    static constexpr float EXPLOSION_SPHERE_RADIUS = 15.0f;
    static constexpr float PROJECTILE_SPHERE_RADIUS = 0.4f;

    /**
     * @brief Build a table
     * @param default_tier Tier used by lookups that omit one
     */
    explicit GeometryTierTable(QualityTier default_tier = DEFAULT_QUALITY_TIER);

    /**
     * @brief Process-wide table using DEFAULT_QUALITY_TIER
     */
    [[nodiscard]] static const GeometryTierTable& shared();

    [[nodiscard]] QualityTier default_tier() const { return m_default_tier; }

    /**
     * @brief Sphere segments for a tier
     * @param tier Requested tier, or the table default when empty
     */
    [[nodiscard]] SegmentSpec sphere_segments(std::optional<QualityTier> tier = std::nullopt) const;

    /**
     * @brief Radial cylinder segments for a tier
     * @param tier Requested tier, or the table default when empty
     */
    [[nodiscard]] uint32_t cylinder_segments(std::optional<QualityTier> tier = std::nullopt) const;

    [[nodiscard]] const SpherePreset& radar_dome() const { return m_radar_dome; }
    [[nodiscard]] const SpherePreset& explosion_sphere() const { return m_explosion_sphere; }
    [[nodiscard]] const SpherePreset& projectile_sphere() const { return m_projectile_sphere; }

private:
    [[nodiscard]] SpherePreset make_preset(float radius, QualityTier tier, const SphereSweep& sweep) const;

    QualityTier m_default_tier;

    std::array<SegmentSpec, QUALITY_TIER_COUNT> m_sphere;
    std::array<uint32_t, QUALITY_TIER_COUNT> m_cylinder;

    SpherePreset m_radar_dome;
    SpherePreset m_explosion_sphere;
    SpherePreset m_projectile_sphere;
};

} // namespace efx
