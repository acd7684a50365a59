#include <efx/GeometryTierTable.hpp>

namespace efx {

namespace {

// Indexed by QualityTier: high, medium, low, minimal
constexpr std::array<SegmentSpec, QUALITY_TIER_COUNT> SPHERE_SEGMENTS = {{
    {16, 16},
    {10, 8},
    {6, 5},
    {4, 3}
}};

constexpr std::array<uint32_t, QUALITY_TIER_COUNT> CYLINDER_SEGMENTS = {16, 8, 6, 4};

// Full azimuth, upper hemisphere
const SphereSweep DOME_SWEEP{
    .phi_start = 0.0f,
    .phi_length = glm::two_pi<float>(),
    .theta_start = 0.0f,
    .theta_length = glm::half_pi<float>()
};

} // namespace

GeometryTierTable::GeometryTierTable(QualityTier default_tier)
    : m_default_tier(default_tier)
    , m_sphere(SPHERE_SEGMENTS)
    , m_cylinder(CYLINDER_SEGMENTS)
    , m_radar_dome(make_preset(RADAR_DOME_RADIUS, QualityTier::Medium, DOME_SWEEP))
    , m_explosion_sphere(make_preset(EXPLOSION_SPHERE_RADIUS, QualityTier::Low, SphereSweep{}))
    , m_projectile_sphere(make_preset(PROJECTILE_SPHERE_RADIUS, QualityTier::Minimal, SphereSweep{}))
{}

const GeometryTierTable& GeometryTierTable::shared() {
    static const GeometryTierTable table;
    return table;
}

SegmentSpec GeometryTierTable::sphere_segments(std::optional<QualityTier> tier) const {
    return m_sphere[tier_index(tier.value_or(m_default_tier))];
}

uint32_t GeometryTierTable::cylinder_segments(std::optional<QualityTier> tier) const {
    return m_cylinder[tier_index(tier.value_or(m_default_tier))];
}

// Only valid once m_sphere is initialized; it is declared before the presets.
SpherePreset GeometryTierTable::make_preset(float radius, QualityTier tier, const SphereSweep& sweep) const {
    return SpherePreset{
        .radius = radius,
        .tier = tier,
        .segments = m_sphere[tier_index(tier)],
        .sweep = sweep
    };
}

} // namespace efx
