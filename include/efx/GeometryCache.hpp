#pragma once

#include "MeshBuilder.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace efx {

/**
 * @brief Counters describing what a GeometryCache currently holds
 */
struct GeometryCacheStats {
    std::size_t entries = 0;
    std::size_t spheres = 0;
    std::size_t cylinders = 0;
    std::size_t vertices = 0;
    std::size_t indices = 0;
    std::size_t bytes = 0;
};

/**
 * @brief Shares generated meshes between every entity that asks for the same shape
 *
 * Meshes are keyed by all of their shape parameters, built on first request and
 * handed out as shared immutable data. Removing or clearing an entry only drops the
 * cache's reference; meshes still held by callers stay alive.
 *
 * Owned by the render loop. Not thread-safe.
 */
class GeometryCache {
public:
    using MeshPtr = std::shared_ptr<const MeshData>;

    GeometryCache() = default;

    // Non-copyable
    GeometryCache(const GeometryCache&) = delete;
    GeometryCache& operator=(const GeometryCache&) = delete;

    // Movable
    GeometryCache(GeometryCache&&) noexcept = default;
    GeometryCache& operator=(GeometryCache&&) noexcept = default;

    [[nodiscard]] std::expected<MeshPtr, std::string> sphere(
        float radius,
        const SegmentSpec& segments,
        const SphereSweep& sweep = {}
    );

    [[nodiscard]] std::expected<MeshPtr, std::string> sphere(const SpherePreset& preset);

    [[nodiscard]] std::expected<MeshPtr, std::string> cylinder(const CylinderShape& shape);

    [[nodiscard]] GeometryCacheStats stats() const;

    [[nodiscard]] bool contains(std::string_view key) const;

    /**
     * @brief Drop one entry
     * @return true if the key was present
     */
    bool remove(std::string_view key);

    void clear();

    [[nodiscard]] static std::string sphere_key(float radius, const SegmentSpec& segments, const SphereSweep& sweep);
    [[nodiscard]] static std::string cylinder_key(const CylinderShape& shape);

private:
    template<typename Build>
    std::expected<MeshPtr, std::string> get_or_build(std::string key, Build&& build);

    std::unordered_map<std::string, MeshPtr> m_meshes;
};

} // namespace efx
