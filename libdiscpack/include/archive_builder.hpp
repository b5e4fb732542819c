/**
 * @file archive_builder.hpp
 * @brief Compresses a group of source files into a ZIP held by a staging buffer.
 */

#ifndef DISCPACK_ARCHIVE_BUILDER_HPP
#define DISCPACK_ARCHIVE_BUILDER_HPP

#include "buffer_source.hpp"
#include "source_file.hpp"
#include <stdexcept>
#include <vector>

namespace discpack {

/**
 * @brief Raised when libarchive or a source file read fails mid-part.
 */
class ArchiveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Builds one ZIP archive per call using libarchive.
 *
 * @details Compressed output is never written to a file by libarchive
 * itself: a client write callback forwards every block to the
 * IBufferSource handed to build(). Entries use deflate at the
 * configured level (9 by default, favoring size over speed) and are
 * named after SourceFile::relative_name, in input order. Two files with
 * the same name produce two entries with the same name.
 */
class ArchiveBuilder {
public:
    static constexpr int kDefaultCompressionLevel = 9;

    /**
     * @param compression_level Deflate level, 0 (store) to 9 (smallest).
     * @throws std::invalid_argument if the level is outside 0..9.
     */
    explicit ArchiveBuilder(int compression_level = kDefaultCompressionLevel);

    /**
     * @brief Compresses files, in order, into buffer.
     *
     * @param files Files to add to the archive.
     * @param buffer Destination; receives the complete archive on success.
     * @throws ArchiveError if a file can't be read or libarchive fails.
     * @throws std::runtime_error (or whatever the buffer throws) on buffer I/O errors.
     */
    void build(const std::vector<SourceFile>& files, IBufferSource& buffer) const;

    [[nodiscard]] int compression_level() const noexcept { return compression_level_; }

private:
    int compression_level_;
};

} // namespace discpack

#endif // DISCPACK_ARCHIVE_BUILDER_HPP
