/**
 * @file events.hpp
 * @brief Events published while parts move through
 * Planned -> BufferSelected -> EntriesCompressed -> Flushed -> BufferDisposed.
 *
 * Plain data carriers for EventBus subscribers.
 */

#ifndef DISCPACK_EVENTS_HPP
#define DISCPACK_EVENTS_HPP

#include "buffer_source.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace discpack {

/**
 * @brief Emitted once per part before any work on it starts.
 */
struct PartPlannedEvent {
    std::size_t index = 0;         ///< Zero-based part number
    std::size_t file_count = 0;    ///< Number of files in the part
    std::uint64_t input_bytes = 0; ///< Sum of uncompressed sizes
    bool oversized = false;        ///< True if a single file exceeds the budget
};

/**
 * @brief Emitted when the staging buffer of a part has been created.
 */
struct PartBufferSelectedEvent {
    std::size_t index = 0;
    BufferKind kind = BufferKind::Disk;
    std::filesystem::path staging_path; ///< Temp file of a disk buffer, empty for memory
};

/**
 * @brief Emitted when every entry of a part has been compressed.
 */
struct PartCompressedEvent {
    std::size_t index = 0;
    std::uint64_t archive_bytes = 0; ///< Compressed archive size in the buffer
};

/**
 * @brief Emitted after the part file is written and its buffer released.
 */
struct PartWriteCompleteEvent {
    std::size_t index = 0;
    std::filesystem::path path;            ///< Final archive path
    std::uint64_t input_bytes = 0;
    std::uint64_t archive_bytes = 0;
    std::size_t file_count = 0;
    BufferKind kind = BufferKind::Disk;
    std::chrono::milliseconds duration{0}; ///< Buffer selection to release
};

/**
 * @brief Emitted when a part fails; the run stops after this.
 */
struct PartErrorEvent {
    std::size_t index = 0;
    std::string error_message;
};

} // namespace discpack

#endif // DISCPACK_EVENTS_HPP
