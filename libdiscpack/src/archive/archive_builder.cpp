#include "../../include/archive_builder.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace discpack {

namespace fs = std::filesystem;

static const char* builder_tag() {
    return "ArchiveBuilder";
}

// --- helpers ---

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

struct ArchiveWriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
using ArchiveWritePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const noexcept { archive_entry_free(e); }
};
using ArchiveEntryPtr = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

// state shared with the libarchive write callback
struct WriteContext {
    IBufferSource* buffer = nullptr;
    std::exception_ptr error;
};

la_ssize_t write_to_buffer(archive* a, void* client_data, const void* data, const size_t length) {
    auto* ctx = static_cast<WriteContext*>(client_data);
    try {
        ctx->buffer->write(data, length);
        return static_cast<la_ssize_t>(length);
    } catch (...) {
        // no exception may cross libarchive; build() rethrows it
        ctx->error = std::current_exception();
        archive_set_error(a, EIO, "staging buffer write failed");
        return -1;
    }
}

std::string error_string(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

[[noreturn]] void fail(archive* a, const WriteContext& ctx, const std::string& what) {
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }
    throw ArchiveError(what + ": " + error_string(a));
}

std::time_t modification_time(const fs::path& p) {
    std::error_code ec;
    const auto written = fs::last_write_time(p, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't read mtime of " + p.string() + ", using current time", builder_tag());
        return std::time(nullptr);
    }
    return std::chrono::system_clock::to_time_t(std::chrono::file_clock::to_sys(written));
}

void set_option(archive* a, const char* key, const std::string& value) {
    const int r = archive_write_set_format_option(a, "zip", key, value.c_str());
    if (r != ARCHIVE_OK) {
        Logger::log(LogLevel::Warning,
                    std::string("zip option ") + key + "=" + value + " not applied: " + error_string(a),
                    builder_tag());
    }
}

void add_entry(archive* a, const WriteContext& ctx, const SourceFile& file, std::vector<char>& block) {
    std::ifstream ifs(file.absolute_path, std::ios::binary);
    if (!ifs) {
        throw ArchiveError("Can't open file for reading: " + file.absolute_path.string());
    }

    std::error_code ec;
    const auto size = fs::file_size(file.absolute_path, ec);
    if (ec) {
        throw ArchiveError("Can't stat " + file.absolute_path.string() + ": " + ec.message());
    }

    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        throw ArchiveError("archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), file.relative_name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry.get(), modification_time(file.absolute_path), 0);

    int r = archive_write_header(a, entry.get());
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_string(a), builder_tag());
    }
    if (r < ARCHIVE_WARN) {
        fail(a, ctx, "archive_write_header for " + file.relative_name);
    }

    std::uintmax_t streamed = 0;
    while (ifs) {
        ifs.read(block.data(), static_cast<std::streamsize>(block.size()));
        const std::streamsize got = ifs.gcount();
        if (got <= 0) break;
        if (archive_write_data(a, block.data(), static_cast<size_t>(got)) < 0) {
            fail(a, ctx, "archive_write_data for " + file.relative_name);
        }
        streamed += static_cast<std::uintmax_t>(got);
    }
    if (ifs.bad()) {
        throw ArchiveError("Read error on " + file.absolute_path.string());
    }
    if (streamed != size) {
        throw ArchiveError("File changed while archiving: " + file.absolute_path.string() +
                           " (expected " + std::to_string(size) + " bytes, read " +
                           std::to_string(streamed) + ")");
    }

    r = archive_write_finish_entry(a);
    if (r < ARCHIVE_WARN) {
        fail(a, ctx, "archive_write_finish_entry for " + file.relative_name);
    }

    Logger::log(LogLevel::Debug, "Added entry " + file.relative_name + " (" + std::to_string(size) + " bytes)", builder_tag());
}

} // namespace

// --- ArchiveBuilder ---

ArchiveBuilder::ArchiveBuilder(const int compression_level) : compression_level_(compression_level) {
    if (compression_level < 0 || compression_level > 9) {
        throw std::invalid_argument("compression level must be between 0 and 9, got " +
                                    std::to_string(compression_level));
    }
}

void ArchiveBuilder::build(const std::vector<SourceFile>& files, IBufferSource& buffer) const {
    ArchiveWritePtr a(archive_write_new());
    if (!a) {
        throw ArchiveError("archive_write_new failed");
    }

    WriteContext ctx;
    ctx.buffer = &buffer;

    if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK) {
        fail(a.get(), ctx, "archive_write_set_format_zip");
    }
    if (compression_level_ == 0) {
        set_option(a.get(), "compression", "store");
    } else {
        set_option(a.get(), "compression", "deflate");
        set_option(a.get(), "compression-level", std::to_string(compression_level_));
    }
    // no block padding after the end of central directory record
    archive_write_set_bytes_in_last_block(a.get(), 1);

    if (archive_write_open(a.get(), &ctx, nullptr, write_to_buffer, nullptr) != ARCHIVE_OK) {
        fail(a.get(), ctx, "archive_write_open");
    }

    std::vector<char> block(kReadBlockSize);
    for (const auto& file : files) {
        add_entry(a.get(), ctx, file, block);
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        fail(a.get(), ctx, "archive_write_close");
    }

    Logger::log(LogLevel::Debug,
                "Compressed " + std::to_string(files.size()) + " entries into " +
                std::to_string(buffer.size()) + " bytes (" +
                std::string(buffer_kind_to_string(buffer.kind())) + " buffer)",
                builder_tag());
}

} // namespace discpack
