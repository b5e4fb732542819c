#include "../../include/buffer_source.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace discpack {

namespace {

constexpr std::size_t kCopyBlockSize = 64 * 1024;

void write_to_stream(std::ostream& out, const unsigned char* data, const std::size_t length) {
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!out) {
        throw std::runtime_error("Failed to write buffered archive data to output stream");
    }
}

} // namespace

std::string_view buffer_kind_to_string(const BufferKind kind) noexcept {
    switch (kind) {
        case BufferKind::Memory: return "memory";
        case BufferKind::Disk:   return "disk";
    }
    return "unknown";
}

// --- MemoryBufferSource ---

MemoryBufferSource::~MemoryBufferSource() {
    dispose();
}

void MemoryBufferSource::write(const std::span<const unsigned char> bytes) {
    if (disposed_) {
        throw std::logic_error("MemoryBufferSource: write after dispose");
    }
    data_.insert(data_.end(), bytes.begin(), bytes.end());
}

std::vector<unsigned char> MemoryBufferSource::read_all() {
    if (disposed_) {
        throw std::logic_error("MemoryBufferSource: read after dispose");
    }
    return data_;
}

void MemoryBufferSource::copy_to(std::ostream& out) {
    if (disposed_) {
        throw std::logic_error("MemoryBufferSource: read after dispose");
    }
    for (std::size_t offset = 0; offset < data_.size(); offset += kCopyBlockSize) {
        const std::size_t len = std::min(kCopyBlockSize, data_.size() - offset);
        write_to_stream(out, data_.data() + offset, len);
    }
}

void MemoryBufferSource::dispose() noexcept {
    if (disposed_) return;
    std::vector<unsigned char>().swap(data_);
    disposed_ = true;
}

// --- DiskBufferSource ---

DiskBufferSource::DiskBufferSource()
    : path_(make_temp_file_path("part", ".tmp")) {
    // "x": fail instead of truncating if the name is somehow taken
    file_ = open_file(path_, "w+bx");
    if (!file_) {
        const std::string reason = std::strerror(errno);
        throw std::runtime_error("Can't create temp buffer file " + path_.string() + ": " + reason);
    }
    Logger::log(LogLevel::Debug, "Created temp buffer: " + path_.string(), "DiskBufferSource");
}

DiskBufferSource::~DiskBufferSource() {
    dispose();
}

void DiskBufferSource::write(const std::span<const unsigned char> bytes) {
    if (disposed_) {
        throw std::logic_error("DiskBufferSource: write after dispose");
    }
    if (bytes.empty()) return;

    if (!at_end_) {
        if (std::fseek(file_, 0, SEEK_END) != 0) {
            throw std::runtime_error("Can't seek temp buffer file " + path_.string());
        }
        at_end_ = true;
    }

    const std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), file_);
    if (written != bytes.size()) {
        const std::string reason = std::strerror(errno);
        throw std::runtime_error("Short write to temp buffer file " + path_.string() + ": " + reason);
    }
    size_ += written;
}

void DiskBufferSource::rewind_for_read() {
    if (disposed_) {
        throw std::logic_error("DiskBufferSource: read after dispose");
    }
    if (std::fflush(file_) != 0 || std::fseek(file_, 0, SEEK_SET) != 0) {
        const std::string reason = std::strerror(errno);
        throw std::runtime_error("Can't rewind temp buffer file " + path_.string() + ": " + reason);
    }
    at_end_ = false;
}

std::vector<unsigned char> DiskBufferSource::read_all() {
    rewind_for_read();
    std::vector<unsigned char> data(static_cast<std::size_t>(size_));
    if (!data.empty()) {
        const std::size_t got = std::fread(data.data(), 1, data.size(), file_);
        if (got != data.size()) {
            throw std::runtime_error("Short read from temp buffer file " + path_.string());
        }
    }
    return data;
}

void DiskBufferSource::copy_to(std::ostream& out) {
    rewind_for_read();
    std::array<unsigned char, kCopyBlockSize> block{};
    std::uint64_t remaining = size_;
    while (remaining > 0) {
        const std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, block.size()));
        const std::size_t got = std::fread(block.data(), 1, want, file_);
        if (got != want) {
            throw std::runtime_error("Short read from temp buffer file " + path_.string());
        }
        write_to_stream(out, block.data(), got);
        remaining -= got;
    }
}

void DiskBufferSource::dispose() noexcept {
    if (disposed_) return;
    disposed_ = true;
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    remove_file_quietly(path_, "DiskBufferSource");
}

} // namespace discpack
