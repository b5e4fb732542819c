#ifndef DISCPACK_REPORT_GENERATOR_HPP
#define DISCPACK_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../../libdiscpack/include/buffer_source.hpp"

struct PartResult {
    std::size_t index{};              // zero-based part number
    std::filesystem::path path;       // archive written (empty on failure)
    std::size_t file_count{};         // entries in the part
    std::uint64_t input_bytes{};      // uncompressed total
    std::uint64_t archive_bytes{};    // final archive size
    discpack::BufferKind buffer{discpack::BufferKind::Disk};
    double seconds{};                 // build + flush time
    bool success{};
    std::string error_msg;            // if !success, reason of failure
};

std::string csv_escape(const std::string& data);

void print_console_report(const std::vector<PartResult>& results, double total_seconds);

/**
 * @brief Writes one CSV row per part.
 * @return false if the report file can't be written.
 */
bool export_csv_report(const std::vector<PartResult>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // DISCPACK_REPORT_GENERATOR_HPP
