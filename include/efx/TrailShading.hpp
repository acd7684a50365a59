#pragma once

#include "Common.hpp"
#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace efx {

/// Per-vertex channel names the trail shaders bind to
inline constexpr std::string_view TRAIL_AGE_ATTRIBUTE = "trailAge";
inline constexpr std::string_view TRAIL_INTENSITY_ATTRIBUTE = "trailIntensity";

/**
 * @brief Per-vertex age and intensity of a trail, one scalar channel each
 *
 * Both arrays have the length fixed at construction and are indexed like the trail's
 * position buffer. Ages run from 0 (just emitted) to 1 (fully faded); intensity is
 * the thrust state at emission, 0 to 1. The shading stage does not clamp, so writers
 * either keep values in [0, 1] or use set_clamped().
 *
 * Indexed writes are bounds-checked with assert() only.
 */
class TrailAttributeBuffer {
public:
    explicit TrailAttributeBuffer(uint32_t max_points);

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_age.size()); }

    [[nodiscard]] std::span<const float> ages() const { return m_age; }
    [[nodiscard]] std::span<const float> intensities() const { return m_intensity; }
    [[nodiscard]] std::span<float> ages() { return m_age; }
    [[nodiscard]] std::span<float> intensities() { return m_intensity; }

    [[nodiscard]] float age(uint32_t index) const;
    [[nodiscard]] float intensity(uint32_t index) const;

    void set(uint32_t index, float age, float intensity);

    /**
     * @brief Write a point with both values clamped to [0, 1]
     */
    void set_clamped(uint32_t index, float age, float intensity);

    /**
     * @brief Write a point from particle lifetime bookkeeping
     *
     * age = lifetime / max_lifetime, clamped. A non-positive max_lifetime marks the
     * point as fully aged.
     */
    void write_age_ratio(uint32_t index, float lifetime, float max_lifetime, float intensity);

    /**
     * @brief Spread ages linearly over the first active_points entries
     *
     * Index 0 is the newest point (age 0), index active_points - 1 the oldest (age 1).
     * Entries past active_points are reset to fully aged with zero intensity.
     */
    void fill_fade(uint32_t active_points, float intensity);

private:
    std::vector<float> m_age;
    std::vector<float> m_intensity;
};

/**
 * @brief Interleaved per-vertex data of binding 0
 */
struct TrailVertex {
    glm::vec3 position;
    glm::vec3 color;
};

/**
 * @brief Line-strip geometry of a trail or exhaust plume
 *
 * Owned by the entity that emits the trail. Trail attributes are optional until
 * attach_trail_attributes() binds them.
 */
class TrailGeometry {
public:
    explicit TrailGeometry(uint32_t point_capacity, const glm::vec3& color = glm::vec3(1.0f));

    [[nodiscard]] uint32_t point_capacity() const { return static_cast<uint32_t>(m_vertices.size()); }

    [[nodiscard]] std::span<const TrailVertex> vertices() const { return m_vertices; }
    [[nodiscard]] std::span<TrailVertex> vertices() { return m_vertices; }

    [[nodiscard]] bool has_trail_attributes() const { return m_trail_attributes.has_value(); }

    /**
     * @brief Attached attribute buffer, or nullptr before attachment
     */
    [[nodiscard]] TrailAttributeBuffer* trail_attributes();
    [[nodiscard]] const TrailAttributeBuffer* trail_attributes() const;

    /**
     * @brief Look up a scalar channel by its shader name
     */
    [[nodiscard]] std::optional<std::span<const float>> channel(std::string_view name) const;

private:
    friend std::expected<std::reference_wrapper<TrailAttributeBuffer>, std::string>
        attach_trail_attributes(TrailGeometry& geometry, uint32_t max_points);

    std::vector<TrailVertex> m_vertices;
    std::optional<TrailAttributeBuffer> m_trail_attributes;
};

/**
 * @brief Allocate zeroed age and intensity channels on a trail geometry
 *
 * Calling it again replaces both arrays; the previous ones are dropped, not merged.
 * References returned by an earlier call, and spans taken from ages(), intensities()
 * or TrailGeometry::channel(), are invalidated by the replacement. Fetch them again
 * from the geometry afterwards.
 *
 * @param geometry Geometry to extend
 * @param max_points Length of each channel, must be positive
 * @return The attached buffer, or an error if max_points is zero
 */
std::expected<std::reference_wrapper<TrailAttributeBuffer>, std::string> attach_trail_attributes(
    TrailGeometry& geometry,
    uint32_t max_points
);

/**
 * @brief Vulkan vertex input state for TrailGeometry
 *
 * Binding 0: TrailVertex (location 0 position, location 1 color).
 * Binding 1: age (location 2). Binding 2: intensity (location 3).
 */
struct TrailVertexLayout {
    std::array<vk::VertexInputBindingDescription, 3> bindings;
    std::array<vk::VertexInputAttributeDescription, 4> attributes;
};

[[nodiscard]] TrailVertexLayout trail_vertex_layout();

struct TrailFragmentInput {
    float age;              ///< Interpolated age, 0 to 1
    float intensity;        ///< Interpolated intensity, 0 to 1
    glm::vec3 base_color;   ///< Interpolated vertex color
    float time;             ///< Global clock in seconds
};

struct TrailFragment {
    glm::vec3 color;
    float alpha;
};

inline constexpr float TRAIL_HOT_CORE_BLEND = 0.5f;
inline constexpr float TRAIL_FLICKER_FREQUENCY = 10.0f;
inline constexpr float TRAIL_FLICKER_AMPLITUDE = 0.1f;
inline constexpr float TRAIL_FLICKER_BASE = 0.9f;
inline constexpr float TRAIL_GLOW_BOOST = 0.3f;
inline constexpr float TRAIL_PEAK_ALPHA = 0.8f;

/**
 * @brief Quadratic recency glow: (1 - age)^2 * intensity
 */
[[nodiscard]] float trail_glow(float age, float intensity);

/**
 * @brief Thrust flicker, sin(time * 10) * 0.1 + 0.9, in [0.8, 1.0]
 */
[[nodiscard]] float trail_pulse(float time);

/**
 * @brief Color and alpha of one trail fragment
 *
 * Same arithmetic as shaders/efx/trail/trail.frag.slang:
 * blend toward white by glow * 0.5, brighten by 1 + glow * pulse * 0.3, and fade
 * alpha linearly to zero at age 1 from a 0.8 peak. Inputs are not clamped.
 */
[[nodiscard]] TrailFragment shade_trail_fragment(const TrailFragmentInput& input);

} // namespace efx
