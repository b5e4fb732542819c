/**
 * @file memory_probe.hpp
 * @brief Best-effort query of the currently available physical memory.
 */

#ifndef DISCPACK_MEMORY_PROBE_HPP
#define DISCPACK_MEMORY_PROBE_HPP

#include <cstdint>
#include <functional>
#include <optional>

namespace discpack {

/**
 * @brief Callable returning available memory in bytes, or nullopt if unknown.
 *
 * BufferSelector takes one of these so tests can substitute a fixed value.
 */
using MemoryProbe = std::function<std::optional<std::uint64_t>()>;

/**
 * @brief Reads the platform's "available memory" figure.
 *
 * - Linux: MemAvailable from /proc/meminfo, falling back to sysinfo()
 *   free + buffer RAM on kernels that don't report it.
 * - Windows: ullAvailPhys from GlobalMemoryStatusEx.
 * - macOS: free + inactive pages from host_statistics64.
 *
 * The value is a snapshot and may be stale by the time it is used.
 *
 * @return Available bytes, or std::nullopt if the query failed.
 */
[[nodiscard]] std::optional<std::uint64_t> query_available_memory() noexcept;

} // namespace discpack

#endif // DISCPACK_MEMORY_PROBE_HPP
