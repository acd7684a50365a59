#include <efx/PerformanceConfig.hpp>
#include <cmath>
#include <format>

namespace efx {

std::expected<void, std::string> validate(const LodDistances& distances) {
    if (!std::isfinite(distances.near) || !std::isfinite(distances.medium) || !std::isfinite(distances.far)) {
        return std::unexpected("LOD distances must be finite");
    }
    if (distances.near < 0.0f) {
        return std::unexpected(std::format("LOD near distance is negative: {}", distances.near));
    }
    if (!(distances.near < distances.medium && distances.medium < distances.far)) {
        return std::unexpected(std::format(
            "LOD distances out of order: near={} medium={} far={}",
            distances.near, distances.medium, distances.far));
    }
    return {};
}

std::expected<void, std::string> validate(const PerformanceBundle& bundle) {
    if (auto result = validate(bundle.particles.lod_distances); !result) {
        return std::unexpected(result.error());
    }
    if (bundle.particles.max_active_systems == 0) {
        return std::unexpected("At least one particle system must be allowed");
    }
    if (bundle.rendering.shadow_map_size != 0 &&
        (bundle.rendering.shadow_map_size & (bundle.rendering.shadow_map_size - 1)) != 0) {
        return std::unexpected(std::format(
            "Shadow map size must be a power of two: {}", bundle.rendering.shadow_map_size));
    }
    return {};
}

} // namespace efx
