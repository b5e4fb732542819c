#include "../../include/partitioner.hpp"
#include "../../include/logger.hpp"
#include <limits>
#include <string>

namespace discpack {

namespace {

std::uint64_t saturating_add(const std::uint64_t a, const std::uint64_t b) noexcept {
    return b > std::numeric_limits<std::uint64_t>::max() - a
               ? std::numeric_limits<std::uint64_t>::max()
               : a + b;
}

} // namespace

std::vector<PartPlan> plan_parts(const std::vector<SourceFile>& files, const std::uint64_t max_part_size_bytes) {
    std::vector<PartPlan> parts;
    PartPlan current;

    for (const auto& file : files) {
        if (!current.files.empty() &&
            saturating_add(current.total_bytes, file.size_bytes) > max_part_size_bytes) {
            current.index = parts.size();
            parts.push_back(std::move(current));
            current = PartPlan{};
        }
        current.files.push_back(file);
        current.total_bytes = saturating_add(current.total_bytes, file.size_bytes);
    }

    if (!current.files.empty()) {
        current.index = parts.size();
        parts.push_back(std::move(current));
    }

    Logger::log(LogLevel::Debug,
                "Planned " + std::to_string(parts.size()) + " parts for " +
                std::to_string(files.size()) + " files (budget " +
                std::to_string(max_part_size_bytes) + " bytes)",
                "Partitioner");
    return parts;
}

} // namespace discpack
