#include <efx/TrailShading.hpp>
#include <efx/Logger.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <format>

namespace efx {

TrailAttributeBuffer::TrailAttributeBuffer(uint32_t max_points)
    : m_age(max_points, 0.0f)
    , m_intensity(max_points, 0.0f)
{}

float TrailAttributeBuffer::age(uint32_t index) const {
    assert(index < m_age.size());
    return m_age[index];
}

float TrailAttributeBuffer::intensity(uint32_t index) const {
    assert(index < m_intensity.size());
    return m_intensity[index];
}

void TrailAttributeBuffer::set(uint32_t index, float age, float intensity) {
    assert(index < m_age.size());
    m_age[index] = age;
    m_intensity[index] = intensity;
}

void TrailAttributeBuffer::set_clamped(uint32_t index, float age, float intensity) {
    set(index, std::clamp(age, 0.0f, 1.0f), std::clamp(intensity, 0.0f, 1.0f));
}

void TrailAttributeBuffer::write_age_ratio(uint32_t index, float lifetime, float max_lifetime, float intensity) {
    float ratio = max_lifetime > 0.0f ? lifetime / max_lifetime : 1.0f;
    set_clamped(index, ratio, intensity);
}

void TrailAttributeBuffer::fill_fade(uint32_t active_points, float intensity) {
    const uint32_t active = std::min(active_points, size());
    const float clamped_intensity = std::clamp(intensity, 0.0f, 1.0f);

    for (uint32_t i = 0; i < active; i++) {
        m_age[i] = active > 1 ? static_cast<float>(i) / static_cast<float>(active - 1) : 0.0f;
        m_intensity[i] = clamped_intensity;
    }
    std::fill(m_age.begin() + active, m_age.end(), 1.0f);
    std::fill(m_intensity.begin() + active, m_intensity.end(), 0.0f);
}

TrailGeometry::TrailGeometry(uint32_t point_capacity, const glm::vec3& color)
    : m_vertices(point_capacity, TrailVertex{glm::vec3(0.0f), color})
{}

TrailAttributeBuffer* TrailGeometry::trail_attributes() {
    return m_trail_attributes ? &*m_trail_attributes : nullptr;
}

const TrailAttributeBuffer* TrailGeometry::trail_attributes() const {
    return m_trail_attributes ? &*m_trail_attributes : nullptr;
}

std::optional<std::span<const float>> TrailGeometry::channel(std::string_view name) const {
    if (!m_trail_attributes) {
        return std::nullopt;
    }
    if (name == TRAIL_AGE_ATTRIBUTE) {
        return m_trail_attributes->ages();
    }
    if (name == TRAIL_INTENSITY_ATTRIBUTE) {
        return m_trail_attributes->intensities();
    }
    return std::nullopt;
}

std::expected<std::reference_wrapper<TrailAttributeBuffer>, std::string> attach_trail_attributes(
    TrailGeometry& geometry,
    uint32_t max_points
) {
    if (max_points == 0) {
        return std::unexpected("Trail attributes need at least one point");
    }

    if (geometry.m_trail_attributes) {
        Logger::instance().debug("Replacing trail attributes ({} -> {} points)",
            geometry.m_trail_attributes->size(), max_points);
    }
    if (max_points != geometry.point_capacity()) {
        Logger::instance().warn("Trail attributes sized {} for geometry with {} points",
            max_points, geometry.point_capacity());
    }

    geometry.m_trail_attributes.emplace(max_points);
    return std::ref(*geometry.m_trail_attributes);
}

TrailVertexLayout trail_vertex_layout() {
    TrailVertexLayout layout;

    layout.bindings = {
        vk::VertexInputBindingDescription()
            .setBinding(0)
            .setStride(sizeof(TrailVertex))
            .setInputRate(vk::VertexInputRate::eVertex),
        vk::VertexInputBindingDescription()
            .setBinding(1)
            .setStride(sizeof(float))
            .setInputRate(vk::VertexInputRate::eVertex),
        vk::VertexInputBindingDescription()
            .setBinding(2)
            .setStride(sizeof(float))
            .setInputRate(vk::VertexInputRate::eVertex)
    };

    layout.attributes = {
        vk::VertexInputAttributeDescription()
            .setLocation(0)
            .setBinding(0)
            .setFormat(vk::Format::eR32G32B32Sfloat)
            .setOffset(offsetof(TrailVertex, position)),
        vk::VertexInputAttributeDescription()
            .setLocation(1)
            .setBinding(0)
            .setFormat(vk::Format::eR32G32B32Sfloat)
            .setOffset(offsetof(TrailVertex, color)),
        vk::VertexInputAttributeDescription()
            .setLocation(2)
            .setBinding(1)
            .setFormat(vk::Format::eR32Sfloat)
            .setOffset(0),
        vk::VertexInputAttributeDescription()
            .setLocation(3)
            .setBinding(2)
            .setFormat(vk::Format::eR32Sfloat)
            .setOffset(0)
    };

    return layout;
}

float trail_glow(float age, float intensity) {
    float freshness = 1.0f - age;
    return freshness * freshness * intensity;
}

float trail_pulse(float time) {
    return std::sin(time * TRAIL_FLICKER_FREQUENCY) * TRAIL_FLICKER_AMPLITUDE + TRAIL_FLICKER_BASE;
}

TrailFragment shade_trail_fragment(const TrailFragmentInput& input) {
    float glow = trail_glow(input.age, input.intensity);

    // White-hot core for the freshest segments
    glm::vec3 color = glm::mix(input.base_color, glm::vec3(1.0f), glow * TRAIL_HOT_CORE_BLEND);

    float pulse = trail_pulse(input.time);
    color *= 1.0f + glow * pulse * TRAIL_GLOW_BOOST;

    float alpha = (1.0f - input.age) * TRAIL_PEAK_ALPHA;

    return TrailFragment{color, alpha};
}

} // namespace efx
