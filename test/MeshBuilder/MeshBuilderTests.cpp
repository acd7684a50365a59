#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <efx/GeometryCache.hpp>
#include <efx/GeometryTierTable.hpp>
#include <efx/Logger.hpp>
#include <efx/MeshBuilder.hpp>
#include <algorithm>

using namespace efx;
using Catch::Matchers::WithinAbs;

namespace {

bool indices_in_range(const MeshData& mesh)
{
    return std::ranges::all_of(mesh.indices, [&](uint32_t i) { return i < mesh.vertices.size(); });
}

bool has_degenerate_triangle(const MeshData& mesh)
{
    for (std::size_t i = 0; i < mesh.indices.size(); i += 3) {
        const auto& a = mesh.vertices[mesh.indices[i]].position;
        const auto& b = mesh.vertices[mesh.indices[i + 1]].position;
        const auto& c = mesh.vertices[mesh.indices[i + 2]].position;
        if (glm::length(glm::cross(b - a, c - a)) < 1e-7f) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_CASE("Full sphere mesh", "[mesh][sphere]")
{
    Logger::instance().set_level(spdlog::level::warn);
    const auto& projectile = GeometryTierTable::shared().projectile_sphere();

    auto mesh = build_sphere_mesh(projectile);
    REQUIRE(mesh.has_value());

    SECTION("vertex grid covers every segment boundary")
    {
        REQUIRE(mesh->vertices.size() == (4 + 1) * (3 + 1));
    }

    SECTION("pole rows emit one triangle per quad")
    {
        // 4 + 8 + 4 triangles for a 4x3 sphere
        REQUIRE(mesh->triangle_count() == 16);
        REQUIRE(mesh->indices.size() == 48);
        REQUIRE_FALSE(has_degenerate_triangle(*mesh));
    }

    SECTION("indices address existing vertices")
    {
        REQUIRE(indices_in_range(*mesh));
    }

    SECTION("vertices sit on the sphere with unit normals")
    {
        for (const auto& vertex : mesh->vertices) {
            REQUIRE_THAT(glm::length(vertex.position), WithinAbs(projectile.radius, 1e-5));
            REQUIRE_THAT(glm::length(vertex.normal), WithinAbs(1.0, 1e-5));
        }
    }

    SECTION("first and last rows are the poles")
    {
        REQUIRE_THAT(mesh->vertices.front().position.y, WithinAbs(0.4, 1e-5));
        REQUIRE_THAT(mesh->vertices.back().position.y, WithinAbs(-0.4, 1e-5));
    }
}

TEST_CASE("Radar dome mesh", "[mesh][sphere]")
{
    const auto& dome = GeometryTierTable::shared().radar_dome();

    auto mesh = build_sphere_mesh(dome);
    REQUIRE(mesh.has_value());

    SECTION("vertex count")
    {
        REQUIRE(mesh->vertices.size() == 11 * 9);
    }

    SECTION("only the north pole row is collapsed")
    {
        // First row: 10 triangles, remaining 7 rows: 20 each
        REQUIRE(mesh->triangle_count() == 10 + 7 * 20);
        REQUIRE_FALSE(has_degenerate_triangle(*mesh));
        REQUIRE(indices_in_range(*mesh));
    }

    SECTION("dome stays above the equator")
    {
        for (const auto& vertex : mesh->vertices) {
            REQUIRE(vertex.position.y >= -1e-5f);
        }
        // Last row is the rim
        REQUIRE_THAT(mesh->vertices.back().position.y, WithinAbs(0.0, 1e-5));
    }
}

TEST_CASE("Sphere mesh rejects bad input", "[mesh][sphere]")
{
    REQUIRE_FALSE(build_sphere_mesh(1.0f, SegmentSpec{0, 4}).has_value());
    REQUIRE_FALSE(build_sphere_mesh(1.0f, SegmentSpec{4, 0}).has_value());
    REQUIRE_FALSE(build_sphere_mesh(0.0f, SegmentSpec{4, 3}).has_value());
    REQUIRE_FALSE(build_sphere_mesh(-2.0f, SegmentSpec{4, 3}).has_value());
}

TEST_CASE("Cylinder mesh", "[mesh][cylinder]")
{
    const uint32_t radial = GeometryTierTable::shared().cylinder_segments(QualityTier::Medium);

    SECTION("closed cylinder has a torso and two caps")
    {
        auto mesh = build_cylinder_mesh({.radial_segments = radial, .height_segments = 2});
        REQUIRE(mesh.has_value());

        REQUIRE(mesh->vertices.size() == (radial + 1) * 3 + 2 * (radial + 2));
        REQUIRE(mesh->triangle_count() == 2 * radial * 2 + 2 * radial);
        REQUIRE(indices_in_range(*mesh));
    }

    SECTION("open cylinder has no caps")
    {
        auto mesh = build_cylinder_mesh({.radial_segments = radial, .open_ended = true});
        REQUIRE(mesh.has_value());

        REQUIRE(mesh->vertices.size() == (radial + 1) * 2);
        REQUIRE(mesh->triangle_count() == 2 * radial);
    }

    SECTION("cone gets a single cap")
    {
        auto mesh = build_cylinder_mesh({.radius_top = 0.0f, .radius_bottom = 1.0f, .radial_segments = radial});
        REQUIRE(mesh.has_value());
        REQUIRE(mesh->vertices.size() == (radial + 1) * 2 + (radial + 2));
    }

    SECTION("torso vertices span the height")
    {
        auto mesh = build_cylinder_mesh({.height = 3.0f, .radial_segments = radial, .open_ended = true});
        REQUIRE(mesh.has_value());
        auto [lowest, highest] = std::ranges::minmax(mesh->vertices, {}, [](const auto& v) { return v.position.y; });
        REQUIRE_THAT(lowest.position.y, WithinAbs(-1.5, 1e-5));
        REQUIRE_THAT(highest.position.y, WithinAbs(1.5, 1e-5));
    }

    SECTION("bad shapes are rejected")
    {
        REQUIRE_FALSE(build_cylinder_mesh({.radial_segments = 0}).has_value());
        REQUIRE_FALSE(build_cylinder_mesh({.height_segments = 0}).has_value());
        REQUIRE_FALSE(build_cylinder_mesh({.height = 0.0f}).has_value());
        REQUIRE_FALSE(build_cylinder_mesh({.radius_top = 0.0f, .radius_bottom = 0.0f}).has_value());
        REQUIRE_FALSE(build_cylinder_mesh({.radius_top = -1.0f}).has_value());
    }
}

TEST_CASE("GeometryCache shares meshes", "[mesh][cache]")
{
    Logger::instance().set_level(spdlog::level::warn);
    const auto& table = GeometryTierTable::shared();
    GeometryCache cache;

    SECTION("same shape returns the same mesh")
    {
        auto first = cache.sphere(table.explosion_sphere());
        auto second = cache.sphere(15.0f, SegmentSpec{6, 5});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->get() == second->get());
        REQUIRE(cache.stats().entries == 1);
    }

    SECTION("different tiers are different entries")
    {
        REQUIRE(cache.sphere(1.0f, table.sphere_segments(QualityTier::High)).has_value());
        REQUIRE(cache.sphere(1.0f, table.sphere_segments(QualityTier::Low)).has_value());
        REQUIRE(cache.stats().spheres == 2);
    }

    SECTION("stats add up per shape")
    {
        auto dome = cache.sphere(table.radar_dome());
        auto tube = cache.cylinder({.radial_segments = table.cylinder_segments()});
        REQUIRE(dome.has_value());
        REQUIRE(tube.has_value());

        auto stats = cache.stats();
        REQUIRE(stats.entries == 2);
        REQUIRE(stats.spheres == 1);
        REQUIRE(stats.cylinders == 1);
        REQUIRE(stats.vertices == (*dome)->vertices.size() + (*tube)->vertices.size());
        REQUIRE(stats.indices == (*dome)->indices.size() + (*tube)->indices.size());
        REQUIRE(stats.bytes == (*dome)->byte_size() + (*tube)->byte_size());
    }

    SECTION("failed builds are reported and not cached")
    {
        auto bad = cache.sphere(1.0f, SegmentSpec{0, 0});
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().find("sphere_") != std::string::npos);
        REQUIRE(cache.stats().entries == 0);
    }

    SECTION("remove and clear drop entries but not handed-out meshes")
    {
        auto mesh = cache.sphere(table.projectile_sphere());
        REQUIRE(mesh.has_value());

        const auto& projectile = table.projectile_sphere();
        auto key = GeometryCache::sphere_key(projectile.radius, projectile.segments, projectile.sweep);
        REQUIRE(cache.contains(key));
        REQUIRE(cache.remove(key));
        REQUIRE_FALSE(cache.contains(key));
        REQUIRE_FALSE(cache.remove(key));
        REQUIRE((*mesh)->vertices.size() == 20);

        REQUIRE(cache.cylinder({}).has_value());
        cache.clear();
        REQUIRE(cache.stats().entries == 0);
    }
}
