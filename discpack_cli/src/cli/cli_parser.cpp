#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

namespace {
// largest MB value that still converts to bytes without overflow
constexpr std::uint64_t kMaxSizeMb = std::numeric_limits<std::uint64_t>::max() / (1024ULL * 1024ULL);

std::vector<std::uint64_t> values_of(const CLI::Option* opt) {
    if (opt->count() == 0) return {};
    return opt->as<std::vector<std::uint64_t>>();
}
} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Directories ---
    app.add_option("--input", settings.input_dir,
                   "Directory to compress (walked recursively).");

    app.add_option("--output", settings.output_dir,
                   "Output directory for the ZIP parts (created if missing).");

    // --- Sizes and presets, resolved in order in the callback below ---
    CLI::Option* partsize = app.add_option("--partsize",
                   "Maximum uncompressed input per ZIP part in MB (default 100).")
                   ->type_name("MB")
                   ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
                   ->check(CLI::Range(std::uint64_t{1}, kMaxSizeMb));

    CLI::Option* threshold = app.add_option("--threshold",
                   "Available memory in MB required to stage a part in RAM (default 100).")
                   ->type_name("MB")
                   ->multi_option_policy(CLI::MultiOptionPolicy::TakeAll)
                   ->check(CLI::Range(std::uint64_t{0}, kMaxSizeMb));

    CLI::Option* cd = app.add_flag("--cd",
                   "Set size constraints for CD capacity (700MB).");
    CLI::Option* dvd = app.add_flag("--dvd",
                   "Set size constraints for DVD capacity (4700MB).");
    CLI::Option* bluray = app.add_flag("--bluray",
                   "Set size constraints for Blu-ray capacity (25000MB).");

    // --- Behaviour ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Print the part layout without writing any archive.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output.");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    // --- Left-to-right size resolution ---
    app.callback([&app, &settings, partsize, threshold, cd, dvd, bluray]() {
        const auto partsize_values = values_of(partsize);
        const auto threshold_values = values_of(threshold);
        std::unordered_map<const CLI::Option*, std::size_t> seen;

        for (const CLI::Option* opt : app.parse_order()) {
            const std::size_t occurrence = seen[opt]++;
            if (opt == partsize && occurrence < partsize_values.size()) {
                settings.budget.part_size_mb = partsize_values[occurrence];
            } else if (opt == threshold && occurrence < threshold_values.size()) {
                settings.budget.threshold_mb = threshold_values[occurrence];
            } else if (opt == cd) {
                settings.budget.apply_preset(discpack::MediaPreset::Cd);
            } else if (opt == dvd) {
                settings.budget.apply_preset(discpack::MediaPreset::Dvd);
            } else if (opt == bluray) {
                settings.budget.apply_preset(discpack::MediaPreset::BluRay);
            }
        }
    });
}
