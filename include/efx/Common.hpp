#ifndef ENGAGEMENTFX_COMMON_HPP
#define ENGAGEMENTFX_COMMON_HPP
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <vulkan/vulkan.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

template<class... Fs>
struct overloaded : Fs...
{
	using Fs::operator()...;
};

// Deduction guide for C++17
template<class... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

namespace efx
{

/**
 * @brief Discrete geometry detail tiers, ordered from most to least detailed
 */
enum class QualityTier : uint8_t
{
	High,
	Medium,
	Low,
	Minimal
};

inline constexpr std::size_t QUALITY_TIER_COUNT = 4;

/// Tier used whenever a caller does not ask for one
inline constexpr QualityTier DEFAULT_QUALITY_TIER = QualityTier::Medium;

inline constexpr std::array ALL_QUALITY_TIERS = {
	QualityTier::High,
	QualityTier::Medium,
	QualityTier::Low,
	QualityTier::Minimal
};

[[nodiscard]] constexpr std::size_t tier_index(QualityTier tier) { return static_cast<std::size_t>(tier); }

[[nodiscard]] constexpr std::string_view to_string(QualityTier tier)
{
	switch (tier)
	{
	case QualityTier::High: return "high";
	case QualityTier::Medium: return "medium";
	case QualityTier::Low: return "low";
	case QualityTier::Minimal: return "minimal";
	}
	std::unreachable();
}

} // namespace efx

#endif // ENGAGEMENTFX_COMMON_HPP
