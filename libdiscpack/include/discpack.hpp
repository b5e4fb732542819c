/**
 * @file discpack.hpp
 * @brief Public API for the discpack library.
 */

#ifndef DISCPACK_HPP
#define DISCPACK_HPP

#include "memory_probe.hpp"
#include "part_writer.hpp"
#include "source_file.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace discpack {

/**
 * @brief Interface for receiving progress and status events during a run.
 */
struct DiscPackObserver {
    virtual ~DiscPackObserver() = default;

    virtual void onPartStart(std::size_t index, std::size_t file_count, std::uint64_t input_bytes) {}

    virtual void onPartFinish(const OutputArtifact& artifact, bool memory_buffered) {}

    virtual void onPartError(std::size_t index, const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the discpack library.
 *
 * @details Wraps scanning, planning and per-part archiving into a simple,
 * blocking API. Uses the PIMPL idiom to keep libarchive out of the
 * public headers.
 */
class DiscPack {
public:
    DiscPack();
    ~DiscPack();

    DiscPack(const DiscPack&) = delete;
    DiscPack& operator=(const DiscPack&) = delete;
    DiscPack(DiscPack&&) noexcept;
    DiscPack& operator=(DiscPack&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Maximum uncompressed input bytes per part.
     * Default: 100 MB.
     */
    DiscPack& partSize(std::uint64_t bytes);

    /**
     * @brief Memory that must be available to stage a part in RAM.
     * Default: 100 MB.
     */
    DiscPack& memoryThreshold(std::uint64_t bytes);

    /**
     * @brief Directory receiving archive_partNNN.zip files. Required.
     */
    DiscPack& outputDirectory(const std::filesystem::path& dir);

    /**
     * @brief Replace the available-memory query.
     * Default: query_available_memory().
     */
    DiscPack& memoryProbe(MemoryProbe probe);

    /**
     * @brief Deflate level 0..9.
     * Default: 9.
     */
    DiscPack& compressionLevel(int level);

    /**
     * @brief Plan and report parts without writing anything.
     * Default: false.
     */
    DiscPack& dryRun(bool val);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer; it is only
     * called from inside pack().
     */
    void setObserver(DiscPackObserver* observer);

    // --- Execution ---

    /**
     * @brief Archives every file under input_dir. Blocks until completion.
     * @throws std::invalid_argument on bad configuration or a missing input directory.
     * @throws std::runtime_error (or ArchiveError) if any part fails.
     */
    std::vector<OutputArtifact> pack(const std::filesystem::path& input_dir);

    /**
     * @brief Archives a prepared file list, in the given order.
     */
    std::vector<OutputArtifact> pack(const std::vector<SourceFile>& files);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace discpack

#endif // DISCPACK_HPP
