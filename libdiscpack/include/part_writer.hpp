/**
 * @file part_writer.hpp
 * @brief Flushes a finished staging buffer to its numbered output file.
 */

#ifndef DISCPACK_PART_WRITER_HPP
#define DISCPACK_PART_WRITER_HPP

#include "buffer_source.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace discpack {

/**
 * @brief The final archive file of one part.
 */
struct OutputArtifact {
    std::size_t part_index = 0;
    std::filesystem::path path;
    std::uint64_t size_bytes = 0;
};

/**
 * @brief Output file name for a part: "archive_part" + 3-digit index + ".zip".
 *
 * Indices of 1000 and above simply get more digits.
 */
[[nodiscard]] std::string part_file_name(std::size_t part_index);

/**
 * @brief Copies buffer to output_dir/part_file_name(part_index), then disposes it.
 *
 * @details The output directory must already exist. An existing file with
 * the same name is overwritten. The buffer is disposed on every path;
 * if the copy fails, the partial output file is removed as well.
 *
 * @param part_index Zero-based part number.
 * @param buffer Buffer holding the complete archive.
 * @param output_dir Destination directory.
 * @return Where the part was written and how large it is.
 * @throws std::runtime_error if the output file can't be created or written.
 */
OutputArtifact write_part(std::size_t part_index,
                          IBufferSource& buffer,
                          const std::filesystem::path& output_dir);

} // namespace discpack

#endif // DISCPACK_PART_WRITER_HPP
