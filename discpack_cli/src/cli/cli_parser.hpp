#ifndef DISCPACK_CLI_PARSER_HPP
#define DISCPACK_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include "../../../libdiscpack/include/part_budget.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool dry_run = false;
    bool quiet = false;

    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    std::filesystem::path input_dir;
    std::filesystem::path output_dir;

    // sizes in MB, resolved in command-line order once parsing completes
    discpack::BudgetSettings budget;

    [[nodiscard]] bool has_directories() const { return !input_dir.empty() && !output_dir.empty(); }
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 *
 * --partsize, --threshold, --cd, --dvd and --bluray are applied left to
 * right after parsing: a preset sets the threshold to the media capacity
 * and clamps the part size in effect at that point; a later --partsize or
 * --threshold overrides it again.
 *
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // DISCPACK_CLI_PARSER_HPP
