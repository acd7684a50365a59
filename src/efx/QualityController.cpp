#include <efx/QualityController.hpp>
#include <efx/Common.hpp>
#include <cmath>

namespace efx {

std::string_view to_string(QualityLevel level) {
    switch (level) {
        case QualityLevel::Low: return "low";
        case QualityLevel::Medium: return "medium";
        case QualityLevel::High: return "high";
    }
    std::unreachable();
}

QualityLevel classify_frame_rate(double fps) {
    // NaN fails every comparison; catch it before it falls through to high.
    if (std::isnan(fps) || fps < LOW_QUALITY_FPS_THRESHOLD) {
        return QualityLevel::Low;
    }
    if (fps < HIGH_QUALITY_FPS_THRESHOLD) {
        return QualityLevel::Medium;
    }
    return QualityLevel::High;
}

QualitySettings get_quality_settings(double fps) {
    switch (classify_frame_rate(fps)) {
        case QualityLevel::Low: return LOW_QUALITY_OVERRIDE;
        case QualityLevel::Medium: return MEDIUM_QUALITY_OVERRIDE;
        case QualityLevel::High: return DEFAULT_PERFORMANCE_BUNDLE;
    }
    std::unreachable();
}

QualityLevel level_of(const QualitySettings& settings) {
    return std::visit(overloaded{
        [](const PerformanceBundle&) { return QualityLevel::High; },
        [](const QualityOverride& o) { return o.level; }
    }, settings);
}

PerformanceBundle apply_quality_settings(const PerformanceBundle& current, const QualitySettings& settings) {
    return std::visit(overloaded{
        [](const PerformanceBundle& full) { return full; },
        [&current](const QualityOverride& o) {
            return PerformanceBundle{
                .particles = o.particles,
                .rendering = current.rendering,
                .effects = o.effects
            };
        }
    }, settings);
}

} // namespace efx
