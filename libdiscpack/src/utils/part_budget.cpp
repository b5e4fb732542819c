#include "../../include/part_budget.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

namespace discpack {

void BudgetSettings::apply_preset(const MediaPreset preset) noexcept {
    const std::uint64_t capacity = preset_capacity_mb(preset);
    threshold_mb = capacity;
    part_size_mb = std::min(part_size_mb, capacity);
}

std::string_view preset_to_string(const MediaPreset preset) noexcept {
    switch (preset) {
        case MediaPreset::Cd:     return "cd";
        case MediaPreset::Dvd:    return "dvd";
        case MediaPreset::BluRay: return "bluray";
    }
    return "";
}

std::optional<MediaPreset> parse_media_preset(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cd") return MediaPreset::Cd;
    if (lower == "dvd") return MediaPreset::Dvd;
    if (lower == "bluray" || lower == "blu-ray") return MediaPreset::BluRay;
    return std::nullopt;
}

std::uint64_t mb_to_bytes(const std::uint64_t mb) {
    constexpr std::uint64_t kMb = 1024ULL * 1024ULL;
    if (mb > std::numeric_limits<std::uint64_t>::max() / kMb) {
        throw std::overflow_error("size of " + std::to_string(mb) + " MB is too large");
    }
    return mb * kMb;
}

PartBudget to_part_budget(const BudgetSettings& settings) {
    PartBudget budget;
    budget.max_part_size_bytes = mb_to_bytes(settings.part_size_mb);
    budget.memory_threshold_bytes = mb_to_bytes(settings.threshold_mb);
    return budget;
}

} // namespace discpack
