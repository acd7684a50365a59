#include <efx/PerformanceGovernor.hpp>
#include <efx/Logger.hpp>
#include <format>

namespace efx {

PerformanceGovernor::PerformanceGovernor(const PerformanceBundle& initial)
    : m_current(initial)
    , m_level(QualityLevel::High)
{}

std::expected<PerformanceGovernor, std::string> PerformanceGovernor::create(const PerformanceBundle& initial) {
    if (auto result = validate(initial); !result) {
        return std::unexpected(std::format("Rejected initial performance bundle: {}", result.error()));
    }
    return PerformanceGovernor(initial);
}

bool PerformanceGovernor::update(double fps) {
    auto settings = get_quality_settings(fps);
    auto level = level_of(settings);

    m_current = apply_quality_settings(m_current, settings);

    if (level == m_level) {
        return false;
    }

    Logger::instance().info("Quality {} -> {} at {:.1f} fps (particles {}/{}, effect pool {})",
        to_string(m_level), to_string(level), fps,
        m_current.particles.max_particles_per_system,
        m_current.particles.max_active_systems,
        m_current.effects.effect_pool_size);

    m_level = level;
    ++m_transitions;
    return true;
}

} // namespace efx
