#include <efx/Config.hpp>
#include <algorithm>
#include <cctype>
#include <format>

namespace efx {

std::expected<QualityTier, std::string> parse_quality_tier(std::string_view name) {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (auto tier : ALL_QUALITY_TIERS) {
        if (lowered == to_string(tier)) {
            return tier;
        }
    }
    return std::unexpected(std::format("Unknown quality tier '{}'", name));
}

std::expected<void, std::string> validate(const EffectsConfig& config) {
    if (config.trail_max_points == 0) {
        return std::unexpected("trail_max_points must be positive");
    }
    if (auto result = validate(config.initial_bundle); !result) {
        return std::unexpected(std::format("Invalid initial bundle: {}", result.error()));
    }
    return {};
}

} // namespace efx
