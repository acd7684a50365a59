#pragma once

#include "GeometryTierTable.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace efx {

/**
 * @brief CPU-side triangle mesh, ready for upload to vertex and index buffers
 */
struct MeshData {
    struct Vertex {
        glm::vec3 position;
        glm::vec3 normal;
        glm::vec2 uv;
    };

    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;  ///< Triangle list, counter-clockwise

    [[nodiscard]] uint32_t triangle_count() const { return static_cast<uint32_t>(indices.size() / 3); }
    [[nodiscard]] std::size_t byte_size() const {
        return vertices.size() * sizeof(Vertex) + indices.size() * sizeof(uint32_t);
    }
};

/**
 * @brief Parameters of a (possibly truncated) cylinder along the Y axis
 */
struct CylinderShape {
    float radius_top = 1.0f;
    float radius_bottom = 1.0f;
    float height = 1.0f;
    uint32_t radial_segments = 8;
    uint32_t height_segments = 1;
    bool open_ended = false;

    friend constexpr bool operator==(const CylinderShape&, const CylinderShape&) = default;
};

/**
 * @brief Build a UV sphere over an angular sweep
 *
 * Produces (width + 1) * (height + 1) vertices. Rows that touch a pole emit only
 * one triangle per quad, so no degenerate triangles are generated.
 *
 * @param radius Sphere radius, must be positive
 * @param segments Subdivision counts, both must be positive
 * @param sweep Angular extent; the default is a full sphere
 * @return Mesh or error message
 */
[[nodiscard]] std::expected<MeshData, std::string> build_sphere_mesh(
    float radius,
    const SegmentSpec& segments,
    const SphereSweep& sweep = {}
);

/**
 * @brief Build the mesh described by a preset
 */
[[nodiscard]] std::expected<MeshData, std::string> build_sphere_mesh(const SpherePreset& preset);

/**
 * @brief Build a cylinder centered on the origin
 *
 * Closed cylinders get a fan cap at each end with a single center vertex.
 * A radius of zero at one end produces a cone; that end gets no cap.
 */
[[nodiscard]] std::expected<MeshData, std::string> build_cylinder_mesh(const CylinderShape& shape);

} // namespace efx
