#include "../../include/part_writer.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace discpack {

namespace {

constexpr const char* kTag = "PartWriter";

// disposes the buffer when the scope ends, however it ends
class DisposeGuard {
public:
    explicit DisposeGuard(IBufferSource& buffer) noexcept : buffer_(buffer) {}
    ~DisposeGuard() { buffer_.dispose(); }

    DisposeGuard(const DisposeGuard&) = delete;
    DisposeGuard& operator=(const DisposeGuard&) = delete;

private:
    IBufferSource& buffer_;
};

} // namespace

std::string part_file_name(const std::size_t part_index) {
    char digits[32];
    std::snprintf(digits, sizeof(digits), "%03zu", part_index);
    return std::string("archive_part") + digits + ".zip";
}

OutputArtifact write_part(const std::size_t part_index,
                          IBufferSource& buffer,
                          const std::filesystem::path& output_dir) {
    DisposeGuard guard(buffer);

    OutputArtifact artifact;
    artifact.part_index = part_index;
    artifact.path = output_dir / part_file_name(part_index);

    std::ofstream out(artifact.path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Can't open output file for writing: " + artifact.path.string());
    }

    try {
        buffer.copy_to(out);
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to finish writing " + artifact.path.string());
        }
    } catch (...) {
        if (out.is_open()) out.close();
        remove_file_quietly(artifact.path, kTag);
        throw;
    }

    artifact.size_bytes = buffer.size();
    Logger::log(LogLevel::Debug,
                "Flushed " + std::to_string(artifact.size_bytes) + " bytes from " +
                std::string(buffer_kind_to_string(buffer.kind())) + " buffer to " +
                artifact.path.string(),
                kTag);
    return artifact;
}

} // namespace discpack
