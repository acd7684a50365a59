#pragma once

#include "QualityController.hpp"
#include <expected>
#include <string>

namespace efx {

/**
 * @brief Owner of the current PerformanceBundle in a render loop
 *
 * Feeds each FPS sample through the quality controller and installs the merged
 * result as the new current bundle in one assignment. Subsystems read current()
 * after update() returns; they never see a half-applied bundle.
 *
 * Not synchronized: create and use it on the render loop thread.
 */
class PerformanceGovernor {
public:
    /**
     * @brief Create a governor
     * @param initial Bundle in effect before the first sample; the governor reports High until then
     * @return Governor, or the validation error of @p initial
     */
    [[nodiscard]] static std::expected<PerformanceGovernor, std::string> create(
        const PerformanceBundle& initial = DEFAULT_PERFORMANCE_BUNDLE
    );

    /**
     * @brief Re-derive the current bundle from an FPS sample
     * @return true if the quality band changed
     */
    bool update(double fps);

    [[nodiscard]] const PerformanceBundle& current() const { return m_current; }
    [[nodiscard]] QualityLevel level() const { return m_level; }

    /// Number of band changes since creation
    [[nodiscard]] uint32_t transition_count() const { return m_transitions; }

private:
    explicit PerformanceGovernor(const PerformanceBundle& initial);

    PerformanceBundle m_current;
    QualityLevel m_level;
    uint32_t m_transitions = 0;
};

} // namespace efx
