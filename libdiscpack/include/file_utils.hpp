/**
 * @file file_utils.hpp
 * @brief Small filesystem helpers shared by buffers and writers.
 */

#ifndef DISCPACK_FILE_UTILS_HPP
#define DISCPACK_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace discpack {

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "w+b").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE* open_file(const std::filesystem::path& path, const char* mode);

    /**
     * @brief Builds a unique, not yet existing file path in the system temp dir.
     *
     * The name follows "discpack-{prefix}_{random_suffix}{extension}".
     *
     * @param prefix A short prefix (e.g., "part").
     * @param extension Extension including the dot (e.g., ".tmp").
     * @throws std::filesystem::filesystem_error if the temp dir is unavailable.
     */
    std::filesystem::path make_temp_file_path(const std::string& prefix,
                                              const std::string& extension);

    /**
     * @brief Removes a file, logging errors instead of throwing.
     *
     * A file that is already gone counts as removed.
     *
     * @param file The file to delete.
     * @param tag The logger tag of the caller.
     * @return true if the file no longer exists afterwards.
     */
    bool remove_file_quietly(const std::filesystem::path& file,
                             std::string_view tag = "file_utils");

} // namespace discpack

#endif // DISCPACK_FILE_UTILS_HPP
