#include "../../include/part_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <exception>
#include <string>

namespace discpack {

namespace {
constexpr const char* kTag = "PartExecutor";
}

PartExecutor::PartExecutor(const BufferSelector& selector,
                           const ArchiveBuilder& builder,
                           const PartBudget budget,
                           std::filesystem::path output_dir,
                           EventBus& bus,
                           const bool dry_run)
    : selector_(selector),
      builder_(builder),
      budget_(budget),
      output_dir_(std::move(output_dir)),
      event_bus_(bus),
      dry_run_(dry_run) {}

std::vector<OutputArtifact> PartExecutor::run(const std::vector<SourceFile>& files) {
    return run(plan_parts(files, budget_.max_part_size_bytes));
}

std::vector<OutputArtifact> PartExecutor::run(const std::vector<PartPlan>& parts) {
    std::vector<OutputArtifact> artifacts;
    artifacts.reserve(parts.size());

    if (parts.empty()) {
        Logger::log(LogLevel::Info, "No input files, nothing to archive", kTag);
        return artifacts;
    }

    for (const auto& part : parts) {
        PartPlannedEvent planned;
        planned.index = part.index;
        planned.file_count = part.files.size();
        planned.input_bytes = part.total_bytes;
        planned.oversized = part.exceeds(budget_.max_part_size_bytes);
        event_bus_.publish(planned);

        if (planned.oversized) {
            Logger::log(LogLevel::Warning,
                        "Part " + std::to_string(part.index) + " holds a single file of " +
                        std::to_string(part.total_bytes) + " bytes, above the part size budget",
                        kTag);
        }

        if (dry_run_) {
            Logger::log(LogLevel::Info,
                        "[dry-run] " + part_file_name(part.index) + ": " +
                        std::to_string(part.files.size()) + " files, " +
                        std::to_string(part.total_bytes) + " bytes",
                        kTag);
            continue;
        }

        try {
            artifacts.push_back(process_part(part));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Part " + std::to_string(part.index) + " failed: " + e.what(), kTag);
            event_bus_.publish(PartErrorEvent{part.index, e.what()});
            throw;
        }
    }

    return artifacts;
}

OutputArtifact PartExecutor::process_part(const PartPlan& part) {
    const auto start = std::chrono::steady_clock::now();

    // released by its destructor if anything below throws
    std::unique_ptr<IBufferSource> buffer = selector_.select(budget_.memory_threshold_bytes);
    const BufferKind kind = buffer->kind();
    PartBufferSelectedEvent selected{part.index, kind, {}};
    if (const auto* disk = dynamic_cast<const DiskBufferSource*>(buffer.get())) {
        selected.staging_path = disk->path();
    }
    event_bus_.publish(selected);

    builder_.build(part.files, *buffer);
    event_bus_.publish(PartCompressedEvent{part.index, buffer->size()});

    OutputArtifact artifact = write_part(part.index, *buffer, output_dir_);
    buffer.reset();

    PartWriteCompleteEvent done;
    done.index = part.index;
    done.path = artifact.path;
    done.input_bytes = part.total_bytes;
    done.archive_bytes = artifact.size_bytes;
    done.file_count = part.files.size();
    done.kind = kind;
    done.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    event_bus_.publish(done);

    Logger::log(LogLevel::Info, "Created " + artifact.path.string(), kTag);
    return artifact;
}

} // namespace discpack
