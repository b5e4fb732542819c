/**
 * @file buffer_source.hpp
 * @brief Staging buffers that hold one part's compressed bytes before flush.
 */

#ifndef DISCPACK_BUFFER_SOURCE_HPP
#define DISCPACK_BUFFER_SOURCE_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace discpack {

/**
 * @brief Where a staging buffer keeps its bytes.
 */
enum class BufferKind {
    Memory, ///< Growable in-process byte vector
    Disk    ///< Uniquely named file in the system temp directory
};

[[nodiscard]] std::string_view buffer_kind_to_string(BufferKind kind) noexcept;

/**
 * @brief Writable-then-readable byte buffer for a single archive part.
 *
 * @details The archive builder appends compressed blocks with write();
 * the part writer then reads everything back once with copy_to() or
 * read_all(), both of which start from offset 0. dispose() releases the
 * underlying storage and is safe to call more than once; implementations
 * also call it from their destructor so the storage never outlives the
 * object, whatever the exit path.
 */
class IBufferSource {
public:
    virtual ~IBufferSource() = default;

    [[nodiscard]] virtual BufferKind kind() const noexcept = 0;

    /**
     * @brief Appends bytes at the end of the buffer.
     * @throws std::logic_error if the buffer was already disposed.
     * @throws std::runtime_error on I/O failure.
     */
    virtual void write(std::span<const unsigned char> bytes) = 0;

    void write(const void* data, std::size_t length) {
        write(std::span<const unsigned char>(static_cast<const unsigned char*>(data), length));
    }

    /**
     * @brief Rewinds and returns the full contents.
     */
    [[nodiscard]] virtual std::vector<unsigned char> read_all() = 0;

    /**
     * @brief Rewinds and streams the full contents into out.
     * @throws std::runtime_error if reading or writing fails.
     */
    virtual void copy_to(std::ostream& out) = 0;

    /// Number of bytes written so far.
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    /**
     * @brief Releases the storage. Idempotent.
     */
    virtual void dispose() noexcept = 0;

    [[nodiscard]] virtual bool disposed() const noexcept = 0;
};

/**
 * @brief IBufferSource backed by a std::vector.
 */
class MemoryBufferSource final : public IBufferSource {
public:
    MemoryBufferSource() = default;
    ~MemoryBufferSource() override;

    MemoryBufferSource(const MemoryBufferSource&) = delete;
    MemoryBufferSource& operator=(const MemoryBufferSource&) = delete;

    [[nodiscard]] BufferKind kind() const noexcept override { return BufferKind::Memory; }

    using IBufferSource::write;
    void write(std::span<const unsigned char> bytes) override;
    [[nodiscard]] std::vector<unsigned char> read_all() override;
    void copy_to(std::ostream& out) override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return data_.size(); }
    void dispose() noexcept override;
    [[nodiscard]] bool disposed() const noexcept override { return disposed_; }

private:
    std::vector<unsigned char> data_;
    bool disposed_ = false;
};

/**
 * @brief IBufferSource backed by a temporary file.
 *
 * @details The file is created exclusively in the system temp directory
 * when the object is constructed and deleted by dispose(). A file that
 * has already vanished by then is not an error.
 */
class DiskBufferSource final : public IBufferSource {
public:
    /**
     * @brief Creates and opens a fresh temp file for read+write.
     * @throws std::runtime_error if the file can't be created.
     */
    DiskBufferSource();
    ~DiskBufferSource() override;

    DiskBufferSource(const DiskBufferSource&) = delete;
    DiskBufferSource& operator=(const DiskBufferSource&) = delete;

    [[nodiscard]] BufferKind kind() const noexcept override { return BufferKind::Disk; }

    using IBufferSource::write;
    void write(std::span<const unsigned char> bytes) override;
    [[nodiscard]] std::vector<unsigned char> read_all() override;
    void copy_to(std::ostream& out) override;
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }
    void dispose() noexcept override;
    [[nodiscard]] bool disposed() const noexcept override { return disposed_; }

    /// Location of the backing temp file.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void rewind_for_read();

    std::filesystem::path path_;
    FILE* file_ = nullptr;
    std::uint64_t size_ = 0;
    bool at_end_ = true; ///< false after a read; the next write must seek back to the end
    bool disposed_ = false;
};

} // namespace discpack

#endif // DISCPACK_BUFFER_SOURCE_HPP
