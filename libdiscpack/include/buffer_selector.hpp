/**
 * @file buffer_selector.hpp
 * @brief Chooses memory or disk staging for each archive part.
 */

#ifndef DISCPACK_BUFFER_SELECTOR_HPP
#define DISCPACK_BUFFER_SELECTOR_HPP

#include "buffer_source.hpp"
#include "memory_probe.hpp"
#include <cstdint>
#include <memory>

namespace discpack {

/**
 * @brief Factory for IBufferSource based on current memory pressure.
 *
 * @details The probe is called on every select(), so a long run adapts
 * when memory frees up or fills between parts. A memory buffer is used
 * only if the probe reports strictly more than the threshold; a failed
 * or throwing probe falls back to disk.
 */
class BufferSelector {
public:
    explicit BufferSelector(MemoryProbe probe = query_available_memory);

    /**
     * @brief Decides which buffer kind the threshold allows right now.
     * @param memory_threshold_bytes Memory that must be available to stage in RAM.
     */
    [[nodiscard]] BufferKind choose(std::uint64_t memory_threshold_bytes) const;

    /**
     * @brief Creates a new, empty buffer of the kind choose() picks.
     * @throws std::runtime_error if a disk buffer can't create its temp file.
     */
    [[nodiscard]] std::unique_ptr<IBufferSource> select(std::uint64_t memory_threshold_bytes) const;

    /**
     * @brief Creates an empty buffer of a given kind.
     */
    [[nodiscard]] static std::unique_ptr<IBufferSource> make_buffer(BufferKind kind);

private:
    MemoryProbe probe_;
};

} // namespace discpack

#endif // DISCPACK_BUFFER_SELECTOR_HPP
