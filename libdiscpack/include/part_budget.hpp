/**
 * @file part_budget.hpp
 * @brief Per-run size limits and the removable-media presets.
 */

#ifndef DISCPACK_PART_BUDGET_HPP
#define DISCPACK_PART_BUDGET_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace discpack {

inline constexpr std::uint64_t kDefaultPartSizeMb = 100;
inline constexpr std::uint64_t kDefaultThresholdMb = 100;

/**
 * @brief Named media capacities.
 */
enum class MediaPreset {
    Cd,     ///< 700 MB
    Dvd,    ///< 4700 MB
    BluRay  ///< 25000 MB
};

/**
 * @brief Size limits in MB, as the user types them.
 *
 * Options are applied one by one in command-line order, so a later
 * option overrides whatever an earlier one set.
 */
struct BudgetSettings {
    std::uint64_t part_size_mb = kDefaultPartSizeMb;
    std::uint64_t threshold_mb = kDefaultThresholdMb;

    /**
     * @brief Applies a preset: threshold becomes the media capacity and
     * the part size currently in effect is clamped to it.
     */
    void apply_preset(MediaPreset preset) noexcept;
};

/**
 * @brief Size limits in bytes, constant for a whole run.
 */
struct PartBudget {
    std::uint64_t max_part_size_bytes = 0;
    std::uint64_t memory_threshold_bytes = 0;
};

[[nodiscard]] constexpr std::uint64_t preset_capacity_mb(const MediaPreset preset) noexcept {
    switch (preset) {
        case MediaPreset::Cd:     return 700;
        case MediaPreset::Dvd:    return 4700;
        case MediaPreset::BluRay: return 25000;
    }
    return 0;
}

[[nodiscard]] std::string_view preset_to_string(MediaPreset preset) noexcept;

/**
 * @brief Parses "cd", "dvd" or "bluray" (case-insensitive).
 */
[[nodiscard]] std::optional<MediaPreset> parse_media_preset(std::string_view name);

/**
 * @brief MB to bytes (x 1024 x 1024).
 * @throws std::overflow_error if the result doesn't fit in 64 bits.
 */
[[nodiscard]] std::uint64_t mb_to_bytes(std::uint64_t mb);

/**
 * @brief Converts MB settings to the byte budget handed to the library.
 */
[[nodiscard]] PartBudget to_part_budget(const BudgetSettings& settings);

} // namespace discpack

#endif // DISCPACK_PART_BUDGET_HPP
