/**
 * @file partitioner.hpp
 * @brief Greedy assignment of input files to size-bounded archive parts.
 */

#ifndef DISCPACK_PARTITIONER_HPP
#define DISCPACK_PARTITIONER_HPP

#include "source_file.hpp"
#include <cstdint>
#include <vector>

namespace discpack {

/**
 * @brief One planned archive part: a contiguous slice of the input list.
 */
struct PartPlan {
    std::size_t index = 0;          ///< Zero-based part number
    std::vector<SourceFile> files;  ///< Files in input order
    std::uint64_t total_bytes = 0;  ///< Sum of files' sizes (uncompressed)

    /// True if this part is over budget, which only a lone oversized file can cause.
    [[nodiscard]] bool exceeds(const std::uint64_t max_part_size_bytes) const noexcept {
        return total_bytes > max_part_size_bytes;
    }
};

/**
 * @brief Splits files into ordered parts whose input size fits the budget.
 *
 * @details Single greedy pass in the given order, no sorting: a file
 * that would push the running total past max_part_size_bytes closes the
 * current part, unless that part is still empty. So a file bigger than
 * the budget always lands alone in its own part, which is then allowed
 * to exceed the budget. Every file appears in exactly one part.
 *
 * @param files Files in enumeration order.
 * @param max_part_size_bytes Per-part budget of uncompressed input bytes.
 * @return Parts in order; empty if files is empty.
 */
[[nodiscard]] std::vector<PartPlan> plan_parts(const std::vector<SourceFile>& files,
                                               std::uint64_t max_part_size_bytes);

} // namespace discpack

#endif // DISCPACK_PARTITIONER_HPP
