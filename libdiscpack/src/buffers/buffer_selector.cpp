#include "../../include/buffer_selector.hpp"
#include "../../include/logger.hpp"
#include <exception>
#include <string>

namespace discpack {

namespace {
constexpr const char* kTag = "BufferSelector";
}

BufferSelector::BufferSelector(MemoryProbe probe) : probe_(std::move(probe)) {}

BufferKind BufferSelector::choose(const std::uint64_t memory_threshold_bytes) const {
    std::optional<std::uint64_t> available;
    if (probe_) {
        try {
            available = probe_();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, std::string("Memory probe failed: ") + e.what(), kTag);
        }
    }

    if (!available) {
        Logger::log(LogLevel::Warning, "Available memory unknown, staging part on disk", kTag);
        return BufferKind::Disk;
    }

    const BufferKind kind = *available > memory_threshold_bytes ? BufferKind::Memory : BufferKind::Disk;
    Logger::log(LogLevel::Debug,
                "Available memory " + std::to_string(*available) + " bytes, threshold " +
                std::to_string(memory_threshold_bytes) + " bytes -> " +
                std::string(buffer_kind_to_string(kind)),
                kTag);
    return kind;
}

std::unique_ptr<IBufferSource> BufferSelector::select(const std::uint64_t memory_threshold_bytes) const {
    return make_buffer(choose(memory_threshold_bytes));
}

std::unique_ptr<IBufferSource> BufferSelector::make_buffer(const BufferKind kind) {
    if (kind == BufferKind::Memory) {
        return std::make_unique<MemoryBufferSource>();
    }
    return std::make_unique<DiskBufferSource>();
}

} // namespace discpack
