#include "report_generator.hpp"
#include "../../../libdiscpack/include/logger.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string human_size(const std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
    return oss.str();
}

void print_console_report(const std::vector<PartResult>& results, const double total_seconds) {
    std::uint64_t input_total = 0;
    std::uint64_t archive_total = 0;
    std::size_t files_total = 0;

    std::cout << std::left
              << std::setw(24) << "Part"
              << std::setw(8)  << "Files"
              << std::setw(14) << "Input"
              << std::setw(14) << "Archive"
              << std::setw(8)  << "Buffer"
              << "Result" << "\n";

    for (const auto& r : results) {
        const std::string name = r.path.empty() ? "part " + std::to_string(r.index) : r.path.filename().string();
        std::cout << std::setw(24) << name
                  << std::setw(8)  << r.file_count
                  << std::setw(14) << human_size(r.input_bytes)
                  << std::setw(14) << (r.success ? human_size(r.archive_bytes) : "-")
                  << std::setw(8)  << discpack::buffer_kind_to_string(r.buffer)
                  << (r.success ? "OK" : "FAIL: " + r.error_msg) << "\n";
        input_total += r.input_bytes;
        archive_total += r.archive_bytes;
        files_total += r.file_count;
    }

    std::cout << results.size() << " parts, " << files_total << " files, "
              << human_size(input_total) << " -> " << human_size(archive_total)
              << " in " << std::fixed << std::setprecision(2) << total_seconds << "s" << std::endl;
}

bool export_csv_report(const std::vector<PartResult>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path, std::ios::trunc);
    if (!out) {
        discpack::Logger::log(discpack::LogLevel::Error, "Can't write report: " + output_path.string(), "report");
        return false;
    }

    out << "part,file,files,input_bytes,archive_bytes,buffer,seconds,status,error\n";
    for (const auto& r : results) {
        out << r.index << ","
            << csv_escape(r.path.string()) << ","
            << r.file_count << ","
            << r.input_bytes << ","
            << r.archive_bytes << ","
            << discpack::buffer_kind_to_string(r.buffer) << ","
            << std::fixed << std::setprecision(3) << r.seconds << ","
            << (r.success ? "ok" : "failed") << ","
            << csv_escape(r.error_msg) << "\n";
    }
    out << "# total_seconds," << std::fixed << std::setprecision(3) << total_seconds << "\n";

    if (!out) {
        discpack::Logger::log(discpack::LogLevel::Error, "Failed writing report: " + output_path.string(), "report");
        return false;
    }
    discpack::Logger::log(discpack::LogLevel::Info, "Report written to " + output_path.string(), "report");
    return true;
}
