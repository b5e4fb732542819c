/**
 * @file source_file.hpp
 * @brief Input file record and the recursive directory scanner.
 */

#ifndef DISCPACK_SOURCE_FILE_HPP
#define DISCPACK_SOURCE_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace discpack {

/**
 * @brief One input file as seen by the partitioner and the archive builder.
 *
 * @details relative_name is the path relative to the file's own parent
 * directory, i.e. the bare file name. Files with the same name in
 * different sub-directories therefore get the same entry name inside a
 * part. This mirrors the flat layout the tool has always produced.
 */
struct SourceFile {
    std::filesystem::path absolute_path; ///< Absolute path on disk
    std::string relative_name;           ///< Entry name inside the archive
    std::uint64_t size_bytes = 0;        ///< Uncompressed size

    bool operator==(const SourceFile&) const = default;
};

/**
 * @brief Builds a SourceFile for a single path, reading its size from disk.
 * @throws std::filesystem::filesystem_error if the file can't be stat'ed.
 */
SourceFile make_source_file(const std::filesystem::path& path);

/**
 * @brief Lists every regular file under root, recursively.
 *
 * Symlinks are not followed. The result is sorted by generic path string
 * so the same tree always yields the same part layout.
 *
 * @param root Directory to scan.
 * @return The files, in scan order.
 * @throws std::filesystem::filesystem_error if root itself can't be opened.
 */
std::vector<SourceFile> list_files_recursive(const std::filesystem::path& root);

} // namespace discpack

#endif // DISCPACK_SOURCE_FILE_HPP
