#include <efx/MeshBuilder.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <format>

namespace efx {

std::expected<MeshData, std::string> build_sphere_mesh(
    float radius,
    const SegmentSpec& segments,
    const SphereSweep& sweep
) {
    if (!(radius > 0.0f)) {
        return std::unexpected(std::format("Sphere radius must be positive, got {}", radius));
    }
    if (segments.width_segments == 0 || segments.height_segments == 0) {
        return std::unexpected(std::format("Sphere needs at least one segment per axis, got {}x{}",
            segments.width_segments, segments.height_segments));
    }

    const uint32_t w = segments.width_segments;
    const uint32_t h = segments.height_segments;
    const float theta_end = std::min(sweep.theta_start + sweep.theta_length, glm::pi<float>());
    const bool touches_north = sweep.theta_start <= 0.0f;
    const bool touches_south = theta_end >= glm::pi<float>();

    MeshData mesh;
    mesh.vertices.reserve((w + 1) * (h + 1));

    for (uint32_t iy = 0; iy <= h; iy++) {
        float v = static_cast<float>(iy) / static_cast<float>(h);
        float theta = sweep.theta_start + v * sweep.theta_length;

        // Shift pole texture coordinates to the middle of their quad
        float u_offset = 0.0f;
        if (iy == 0 && touches_north) {
            u_offset = 0.5f / static_cast<float>(w);
        } else if (iy == h && touches_south) {
            u_offset = -0.5f / static_cast<float>(w);
        }

        for (uint32_t ix = 0; ix <= w; ix++) {
            float u = static_cast<float>(ix) / static_cast<float>(w);
            float phi = sweep.phi_start + u * sweep.phi_length;

            glm::vec3 direction(
                -std::cos(phi) * std::sin(theta),
                std::cos(theta),
                std::sin(phi) * std::sin(theta)
            );

            mesh.vertices.push_back({
                direction * radius,
                glm::normalize(direction),
                glm::vec2(u + u_offset, 1.0f - v)
            });
        }
    }

    auto at = [w](uint32_t iy, uint32_t ix) { return iy * (w + 1) + ix; };

    for (uint32_t iy = 0; iy < h; iy++) {
        for (uint32_t ix = 0; ix < w; ix++) {
            uint32_t a = at(iy, ix + 1);
            uint32_t b = at(iy, ix);
            uint32_t c = at(iy + 1, ix);
            uint32_t d = at(iy + 1, ix + 1);

            if (iy != 0 || !touches_north) {
                mesh.indices.insert(mesh.indices.end(), {a, b, d});
            }
            if (iy != h - 1 || !touches_south) {
                mesh.indices.insert(mesh.indices.end(), {b, c, d});
            }
        }
    }

    return mesh;
}

std::expected<MeshData, std::string> build_sphere_mesh(const SpherePreset& preset) {
    return build_sphere_mesh(preset.radius, preset.segments, preset.sweep);
}

namespace {

void append_cap(MeshData& mesh, const CylinderShape& shape, bool top) {
    const float radius = top ? shape.radius_top : shape.radius_bottom;
    const float sign = top ? 1.0f : -1.0f;
    const float y = 0.5f * shape.height * sign;
    const uint32_t center = static_cast<uint32_t>(mesh.vertices.size());

    mesh.vertices.push_back({glm::vec3(0.0f, y, 0.0f), glm::vec3(0.0f, sign, 0.0f), glm::vec2(0.5f)});

    for (uint32_t x = 0; x <= shape.radial_segments; x++) {
        float theta = static_cast<float>(x) / static_cast<float>(shape.radial_segments) * glm::two_pi<float>();
        float cos_theta = std::cos(theta);
        float sin_theta = std::sin(theta);

        mesh.vertices.push_back({
            glm::vec3(radius * sin_theta, y, radius * cos_theta),
            glm::vec3(0.0f, sign, 0.0f),
            glm::vec2(cos_theta * 0.5f + 0.5f, sin_theta * 0.5f * sign + 0.5f)
        });
    }

    for (uint32_t x = 0; x < shape.radial_segments; x++) {
        uint32_t ring = center + 1 + x;
        if (top) {
            mesh.indices.insert(mesh.indices.end(), {ring, ring + 1, center});
        } else {
            mesh.indices.insert(mesh.indices.end(), {ring + 1, ring, center});
        }
    }
}

} // namespace

std::expected<MeshData, std::string> build_cylinder_mesh(const CylinderShape& shape) {
    if (shape.radial_segments == 0 || shape.height_segments == 0) {
        return std::unexpected(std::format("Cylinder needs at least one segment per axis, got {}x{}",
            shape.radial_segments, shape.height_segments));
    }
    if (shape.radius_top < 0.0f || shape.radius_bottom < 0.0f ||
        (shape.radius_top == 0.0f && shape.radius_bottom == 0.0f)) {
        return std::unexpected(std::format("Invalid cylinder radii: top={} bottom={}",
            shape.radius_top, shape.radius_bottom));
    }
    if (!(shape.height > 0.0f)) {
        return std::unexpected(std::format("Cylinder height must be positive, got {}", shape.height));
    }

    const uint32_t radial = shape.radial_segments;
    const uint32_t rows = shape.height_segments;
    const float half_height = 0.5f * shape.height;
    const float slope = (shape.radius_bottom - shape.radius_top) / shape.height;

    MeshData mesh;
    mesh.vertices.reserve((radial + 1) * (rows + 1) + 2 * (radial + 2));

    for (uint32_t y = 0; y <= rows; y++) {
        float v = static_cast<float>(y) / static_cast<float>(rows);
        float radius = v * (shape.radius_bottom - shape.radius_top) + shape.radius_top;

        for (uint32_t x = 0; x <= radial; x++) {
            float u = static_cast<float>(x) / static_cast<float>(radial);
            float theta = u * glm::two_pi<float>();
            float sin_theta = std::sin(theta);
            float cos_theta = std::cos(theta);

            mesh.vertices.push_back({
                glm::vec3(radius * sin_theta, -v * shape.height + half_height, radius * cos_theta),
                glm::normalize(glm::vec3(sin_theta, slope, cos_theta)),
                glm::vec2(u, 1.0f - v)
            });
        }
    }

    auto at = [radial](uint32_t y, uint32_t x) { return y * (radial + 1) + x; };

    for (uint32_t x = 0; x < radial; x++) {
        for (uint32_t y = 0; y < rows; y++) {
            uint32_t a = at(y, x);
            uint32_t b = at(y + 1, x);
            uint32_t c = at(y + 1, x + 1);
            uint32_t d = at(y, x + 1);

            mesh.indices.insert(mesh.indices.end(), {a, b, d});
            mesh.indices.insert(mesh.indices.end(), {b, c, d});
        }
    }

    if (!shape.open_ended) {
        if (shape.radius_top > 0.0f) append_cap(mesh, shape, true);
        if (shape.radius_bottom > 0.0f) append_cap(mesh, shape, false);
    }

    return mesh;
}

} // namespace efx
