#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <efx/Config.hpp>
#include <efx/GeometryTierTable.hpp>
#include <efx/Logger.hpp>

using namespace efx;
using Catch::Matchers::WithinAbs;

TEST_CASE("Sphere segment table", "[geometry][tiers]")
{
    Logger::instance().set_level(spdlog::level::warn);
    const auto& table = GeometryTierTable::shared();

    SECTION("high tier")
    {
        REQUIRE(table.sphere_segments(QualityTier::High) == SegmentSpec{16, 16});
    }

    SECTION("medium tier")
    {
        REQUIRE(table.sphere_segments(QualityTier::Medium) == SegmentSpec{10, 8});
    }

    SECTION("low tier")
    {
        REQUIRE(table.sphere_segments(QualityTier::Low) == SegmentSpec{6, 5});
    }

    SECTION("minimal tier")
    {
        REQUIRE(table.sphere_segments(QualityTier::Minimal) == SegmentSpec{4, 3});
    }

    SECTION("omitted tier falls back to medium")
    {
        REQUIRE(table.default_tier() == QualityTier::Medium);
        REQUIRE(table.sphere_segments() == table.sphere_segments(QualityTier::Medium));
    }
}

TEST_CASE("Cylinder segment table", "[geometry][tiers]")
{
    const auto& table = GeometryTierTable::shared();

    REQUIRE(table.cylinder_segments(QualityTier::High) == 16);
    REQUIRE(table.cylinder_segments(QualityTier::Medium) == 8);
    REQUIRE(table.cylinder_segments(QualityTier::Low) == 6);
    REQUIRE(table.cylinder_segments(QualityTier::Minimal) == 4);
    REQUIRE(table.cylinder_segments() == 8);
}

TEST_CASE("Segment counts never increase from high to minimal", "[geometry][tiers]")
{
    const auto& table = GeometryTierTable::shared();

    for (std::size_t i = 0; i + 1 < ALL_QUALITY_TIERS.size(); i++) {
        auto finer = ALL_QUALITY_TIERS[i];
        auto coarser = ALL_QUALITY_TIERS[i + 1];
        INFO(to_string(finer) << " vs " << to_string(coarser));

        REQUIRE(table.sphere_segments(finer).width_segments >= table.sphere_segments(coarser).width_segments);
        REQUIRE(table.sphere_segments(finer).height_segments >= table.sphere_segments(coarser).height_segments);
        REQUIRE(table.cylinder_segments(finer) >= table.cylinder_segments(coarser));
    }

    for (auto tier : ALL_QUALITY_TIERS) {
        REQUIRE(table.sphere_segments(tier).width_segments > 0);
        REQUIRE(table.sphere_segments(tier).height_segments > 0);
        REQUIRE(table.cylinder_segments(tier) > 0);
    }
}

TEST_CASE("Named sphere presets", "[geometry][presets]")
{
    const auto& table = GeometryTierTable::shared();

    SECTION("projectile sphere is small and minimal")
    {
        const auto& projectile = table.projectile_sphere();
        REQUIRE(projectile.tier == QualityTier::Minimal);
        REQUIRE(projectile.segments.width_segments == 4);
        REQUIRE(projectile.segments.height_segments == 3);
        REQUIRE_THAT(projectile.radius, WithinAbs(0.4, 1e-6));
        REQUIRE(projectile.sweep == SphereSweep{});
    }

    SECTION("explosion sphere uses the low tier")
    {
        const auto& explosion = table.explosion_sphere();
        REQUIRE(explosion.segments == SegmentSpec{6, 5});
        REQUIRE_THAT(explosion.radius, WithinAbs(15.0, 1e-6));
    }

    SECTION("radar dome is an upper hemisphere at medium detail")
    {
        const auto& dome = table.radar_dome();
        REQUIRE(dome.segments == SegmentSpec{10, 8});
        REQUIRE_THAT(dome.radius, WithinAbs(4.0, 1e-6));
        REQUIRE_THAT(dome.sweep.phi_start, WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(dome.sweep.phi_length, WithinAbs(2.0 * glm::pi<double>(), 1e-5));
        REQUIRE_THAT(dome.sweep.theta_start, WithinAbs(0.0, 1e-6));
        REQUIRE_THAT(dome.sweep.theta_length, WithinAbs(glm::pi<double>() / 2.0, 1e-5));
    }
}

TEST_CASE("Table built with another default tier", "[geometry][config]")
{
    GeometryTierTable table(QualityTier::Minimal);

    SECTION("omitted tier uses the configured default")
    {
        REQUIRE(table.sphere_segments() == SegmentSpec{4, 3});
        REQUIRE(table.cylinder_segments() == 4);
    }

    SECTION("explicit tiers are unaffected")
    {
        REQUIRE(table.sphere_segments(QualityTier::High) == SegmentSpec{16, 16});
    }

    SECTION("presets keep their own tiers")
    {
        REQUIRE(table.radar_dome().segments == SegmentSpec{10, 8});
        REQUIRE(table.explosion_sphere().segments == SegmentSpec{6, 5});
    }
}

TEST_CASE("Quality tier names", "[geometry][config]")
{
    SECTION("names round-trip through the parser")
    {
        for (auto tier : ALL_QUALITY_TIERS) {
            auto parsed = parse_quality_tier(to_string(tier));
            REQUIRE(parsed.has_value());
            REQUIRE(*parsed == tier);
        }
    }

    SECTION("parsing ignores case")
    {
        auto parsed = parse_quality_tier("MiNiMaL");
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == QualityTier::Minimal);
    }

    SECTION("unknown names are rejected")
    {
        auto parsed = parse_quality_tier("ultra");
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().find("ultra") != std::string::npos);
    }

    SECTION("empty name is rejected")
    {
        REQUIRE_FALSE(parse_quality_tier("").has_value());
    }
}
