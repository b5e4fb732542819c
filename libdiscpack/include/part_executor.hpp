/**
 * @file part_executor.hpp
 * @brief Builds and writes planned parts one after another.
 */

#ifndef DISCPACK_PART_EXECUTOR_HPP
#define DISCPACK_PART_EXECUTOR_HPP

#include "archive_builder.hpp"
#include "buffer_selector.hpp"
#include "event_bus.hpp"
#include "part_budget.hpp"
#include "part_writer.hpp"
#include "partitioner.hpp"
#include <filesystem>
#include <vector>

namespace discpack {

/**
 * @brief Orchestrates the per-part pipeline.
 *
 * @details For each PartPlan, in order: ask the BufferSelector for a
 * staging buffer, compress the part's files into it with the
 * ArchiveBuilder, flush it with write_part() and release it. Only one
 * buffer is alive at any time. The first failure publishes a
 * PartErrorEvent and is rethrown; later parts are not attempted.
 */
class PartExecutor {
public:
    /**
     * @param selector Picks memory or disk staging for each part.
     * @param builder Compresses a part into its buffer.
     * @param budget Byte limits of the run.
     * @param output_dir Existing directory receiving archive_partNNN.zip files.
     * @param bus EventBus used to publish progress.
     * @param dry_run If true, parts are only announced; nothing is built or written.
     */
    PartExecutor(const BufferSelector& selector,
                 const ArchiveBuilder& builder,
                 PartBudget budget,
                 std::filesystem::path output_dir,
                 EventBus& bus,
                 bool dry_run = false);

    /**
     * @brief Plans the files into parts and processes all of them.
     * @return Artifacts in part order (empty in dry-run mode).
     */
    std::vector<OutputArtifact> run(const std::vector<SourceFile>& files);

    /**
     * @brief Processes already planned parts.
     */
    std::vector<OutputArtifact> run(const std::vector<PartPlan>& parts);

private:
    OutputArtifact process_part(const PartPlan& part);

    const BufferSelector& selector_;
    const ArchiveBuilder& builder_;
    PartBudget budget_;
    std::filesystem::path output_dir_;
    EventBus& event_bus_;
    bool dry_run_;
};

} // namespace discpack

#endif // DISCPACK_PART_EXECUTOR_HPP
