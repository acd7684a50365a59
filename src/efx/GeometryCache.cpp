#include <efx/GeometryCache.hpp>
#include <efx/Logger.hpp>
#include <format>

namespace efx {

std::string GeometryCache::sphere_key(float radius, const SegmentSpec& segments, const SphereSweep& sweep) {
    return std::format("sphere_{}_{}_{}_{}_{}_{}_{}",
        radius, segments.width_segments, segments.height_segments,
        sweep.phi_start, sweep.phi_length, sweep.theta_start, sweep.theta_length);
}

std::string GeometryCache::cylinder_key(const CylinderShape& shape) {
    return std::format("cylinder_{}_{}_{}_{}_{}_{}",
        shape.radius_top, shape.radius_bottom, shape.height,
        shape.radial_segments, shape.height_segments, shape.open_ended);
}

template<typename Build>
std::expected<GeometryCache::MeshPtr, std::string> GeometryCache::get_or_build(std::string key, Build&& build) {
    if (auto it = m_meshes.find(key); it != m_meshes.end()) {
        return it->second;
    }

    auto mesh = build();
    if (!mesh) {
        return std::unexpected(std::format("Failed to build {}: {}", key, mesh.error()));
    }

    Logger::instance().debug("Cached {} ({} vertices, {} triangles)",
        key, mesh->vertices.size(), mesh->triangle_count());

    auto shared = std::make_shared<const MeshData>(std::move(*mesh));
    m_meshes.emplace(std::move(key), shared);
    return shared;
}

std::expected<GeometryCache::MeshPtr, std::string> GeometryCache::sphere(
    float radius,
    const SegmentSpec& segments,
    const SphereSweep& sweep
) {
    return get_or_build(sphere_key(radius, segments, sweep), [&] {
        return build_sphere_mesh(radius, segments, sweep);
    });
}

std::expected<GeometryCache::MeshPtr, std::string> GeometryCache::sphere(const SpherePreset& preset) {
    return sphere(preset.radius, preset.segments, preset.sweep);
}

std::expected<GeometryCache::MeshPtr, std::string> GeometryCache::cylinder(const CylinderShape& shape) {
    return get_or_build(cylinder_key(shape), [&] {
        return build_cylinder_mesh(shape);
    });
}

GeometryCacheStats GeometryCache::stats() const {
    GeometryCacheStats stats;
    stats.entries = m_meshes.size();

    for (const auto& [key, mesh] : m_meshes) {
        if (key.starts_with("sphere_")) {
            stats.spheres++;
        } else if (key.starts_with("cylinder_")) {
            stats.cylinders++;
        }
        stats.vertices += mesh->vertices.size();
        stats.indices += mesh->indices.size();
        stats.bytes += mesh->byte_size();
    }

    return stats;
}

bool GeometryCache::contains(std::string_view key) const {
    return m_meshes.contains(std::string(key));
}

bool GeometryCache::remove(std::string_view key) {
    return m_meshes.erase(std::string(key)) > 0;
}

void GeometryCache::clear() {
    Logger::instance().debug("Clearing geometry cache ({} entries)", m_meshes.size());
    m_meshes.clear();
}

} // namespace efx
