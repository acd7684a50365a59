// EngagementFX playground
// Replays a synthetic frame-rate trace through the performance governor, builds the
// preset meshes through the geometry cache, and shades an exhaust trail.

#include <efx/Config.hpp>
#include <efx/GeometryCache.hpp>
#include <efx/GeometryTierTable.hpp>
#include <efx/Logger.hpp>
#include <efx/PerformanceGovernor.hpp>
#include <efx/TrailShading.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace {

// Heavy salvo: frame rate dips while explosions pile up, then recovers
constexpr std::array FPS_TRACE = {
    60.0, 58.5, 52.0, 44.9, 41.0, 36.5, 29.9, 24.0, 22.5, 30.0, 38.0, 45.0, 59.0, 60.0
};

int run_quality_trace(const efx::EffectsConfig& config) {
    auto governor = efx::PerformanceGovernor::create(config.initial_bundle);
    if (!governor) {
        Logger::instance().error("Failed to create governor: {}", governor.error());
        return 1;
    }

    for (double fps : FPS_TRACE) {
        governor->update(fps);
        const auto& bundle = governor->current();
        Logger::instance().debug("{:5.1f} fps -> {} (systems {}, far LOD {}, shadow map {})",
            fps, efx::to_string(governor->level()),
            bundle.particles.max_active_systems,
            bundle.particles.lod_distances.far,
            bundle.rendering.shadow_map_size);
    }

    Logger::instance().info("Quality trace finished after {} transitions", governor->transition_count());
    return 0;
}

int run_geometry(const efx::EffectsConfig& config) {
    efx::GeometryTierTable table(config.geometry_tier);
    efx::GeometryCache cache;

    for (const auto* preset : {&table.radar_dome(), &table.explosion_sphere(), &table.projectile_sphere()}) {
        auto mesh = cache.sphere(*preset);
        if (!mesh) {
            Logger::instance().error("{}", mesh.error());
            return 1;
        }
    }

    // Launcher tubes follow the configured tier
    auto tube = cache.cylinder(efx::CylinderShape{
        .radius_top = 0.3f,
        .radius_bottom = 0.3f,
        .height = 3.0f,
        .radial_segments = table.cylinder_segments(),
        .height_segments = 1,
        .open_ended = false
    });
    if (!tube) {
        Logger::instance().error("{}", tube.error());
        return 1;
    }

    auto stats = cache.stats();
    Logger::instance().info("Geometry cache: {} spheres, {} cylinders, {} vertices, {:.1f} KB",
        stats.spheres, stats.cylinders, stats.vertices, stats.bytes / 1024.0);
    return 0;
}

int run_trail(const efx::EffectsConfig& config) {
    efx::TrailGeometry plume(config.trail_max_points, glm::vec3(1.0f, 0.55f, 0.1f));

    auto attributes = efx::attach_trail_attributes(plume, config.trail_max_points);
    if (!attributes) {
        Logger::instance().error("Failed to attach trail attributes: {}", attributes.error());
        return 1;
    }

    const uint32_t emitted = std::max(1u, config.trail_max_points / 2);
    attributes->get().fill_fade(emitted, 1.0f);

    const float time = 1.25f;
    for (uint32_t i : {0u, emitted / 2, emitted - 1}) {
        auto fragment = efx::shade_trail_fragment({
            .age = attributes->get().age(i),
            .intensity = attributes->get().intensity(i),
            .base_color = plume.vertices()[i].color,
            .time = time
        });
        Logger::instance().debug("trail point {:3}: rgb({:.3f}, {:.3f}, {:.3f}) alpha {:.3f}",
            i, fragment.color.r, fragment.color.g, fragment.color.b, fragment.alpha);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Logger::instance().set_level(spdlog::level::trace);
    Logger::instance().info("Starting EngagementFX playground...");

    efx::EffectsConfig config{};
    if (argc > 1) {
        auto tier = efx::parse_quality_tier(argv[1]);
        if (!tier) {
            Logger::instance().error("{}", tier.error());
            return 1;
        }
        config.geometry_tier = *tier;
    }

    if (auto result = efx::validate(config); !result) {
        Logger::instance().error("Invalid configuration: {}", result.error());
        return 1;
    }

    Logger::instance().info("Geometry tier: {}", efx::to_string(config.geometry_tier));

    if (int rc = run_quality_trace(config); rc != 0) return rc;
    if (int rc = run_geometry(config); rc != 0) return rc;
    if (int rc = run_trail(config); rc != 0) return rc;

    Logger::instance().info("Playground exited successfully");
    return 0;
}
