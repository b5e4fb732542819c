#include <CLI/CLI.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>
#include "cli_runner.hpp"
#include "cli_parser.hpp"
#include "../report/report_generator.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../../libdiscpack/include/archive_builder.hpp"
#include "../../../libdiscpack/include/buffer_selector.hpp"
#include "../../../libdiscpack/include/event_bus.hpp"
#include "../../../libdiscpack/include/events.hpp"
#include "../../../libdiscpack/include/logger.hpp"
#include "../../../libdiscpack/include/part_budget.hpp"
#include "../../../libdiscpack/include/part_executor.hpp"
#include "../../../libdiscpack/include/source_file.hpp"

using namespace discpack;
namespace fs = std::filesystem;

namespace {

constexpr int kExitRunFailed = 2;

void install_sinks(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), false);
        if (!fileSink->is_open()) {
            std::cerr << "Warning: can't open log file " << settings.log_file.string() << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }

    auto consoleSink = std::make_unique<ConsoleLogSink>();
    if (settings.quiet) {
        consoleSink->min_level = LogLevel::Error;
    } else if (settings.log_level == "NONE") { // IsMember already normalized the case
        consoleSink->enabled = false;
    } else {
        consoleSink->min_level = Logger::string_to_level(settings.log_level);
    }
    Logger::add_sink(std::move(consoleSink));
}

bool report_if_requested(const Settings& settings, const std::vector<PartResult>& results, const double seconds) {
    if (!settings.quiet && !results.empty()) {
        print_console_report(results, seconds);
    }
    if (!settings.report_path.empty()) {
        return export_csv_report(results, settings.report_path, seconds);
    }
    return true;
}

} // namespace

int run_cli(int argc, char* argv[]) {

    CLI::App app{"discpack: split a directory into size-bounded ZIP parts for removable media."};
    Settings settings;
    setup_cli_parser(app, settings);

    if (argc <= 1) {
        std::cout << app.help() << std::endl;
        return 0;
    }

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << "Parse error: " << e.what() << std::endl;
        return app.exit(e);
    }

    install_sinks(settings);

    if (!settings.has_directories()) {
        std::cerr << "Error: Input and output directories must be specified." << std::endl;
        std::cout << app.help() << std::endl;
        return 0;
    }

    std::error_code ec;
    if (!fs::is_directory(settings.input_dir, ec)) {
        std::cerr << "Error: The input directory '" << settings.input_dir.string() << "' does not exist." << std::endl;
        std::cout << app.help() << std::endl;
        return 0;
    }

    const PartBudget budget = to_part_budget(settings.budget);
    Logger::log(LogLevel::Debug,
                "Part size " + std::to_string(settings.budget.part_size_mb) + " MB, memory threshold " +
                std::to_string(settings.budget.threshold_mb) + " MB",
                "main");

    const auto start_total = std::chrono::steady_clock::now();
    std::vector<PartResult> results;

    try {
        if (!settings.dry_run && !fs::exists(settings.output_dir)) {
            Logger::log(LogLevel::Info, "Creating output directory '" + settings.output_dir.string() + "'.", "main");
            fs::create_directories(settings.output_dir);
        }

        const std::vector<SourceFile> files = list_files_recursive(settings.input_dir);

        EventBus bus;

        bus.subscribe<PartPlannedEvent>([&](const PartPlannedEvent& e) {
            PartResult r;
            r.index = e.index;
            r.file_count = e.file_count;
            r.input_bytes = e.input_bytes;
            r.success = settings.dry_run;
            results.push_back(std::move(r));
        });

        bus.subscribe<PartBufferSelectedEvent>([&](const PartBufferSelectedEvent& e) {
            if (!results.empty() && results.back().index == e.index) {
                results.back().buffer = e.kind;
            }
        });

        bus.subscribe<PartWriteCompleteEvent>([&](const PartWriteCompleteEvent& e) {
            if (!results.empty() && results.back().index == e.index) {
                PartResult& r = results.back();
                r.path = e.path;
                r.archive_bytes = e.archive_bytes;
                r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
                r.success = true;
            }
        });

        bus.subscribe<PartErrorEvent>([&](const PartErrorEvent& e) {
            if (!results.empty() && results.back().index == e.index) {
                results.back().success = false;
                results.back().error_msg = e.error_message;
            }
        });

        const BufferSelector selector;
        const ArchiveBuilder builder;
        PartExecutor executor(selector, builder, budget, settings.output_dir, bus, settings.dry_run);
        executor.run(files);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
        static_cast<void>(report_if_requested(settings, results, total_seconds)); // already failing
        return kExitRunFailed;
    }

    const double total_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_total).count();
    const bool reported = report_if_requested(settings, results, total_seconds);

    if (!settings.quiet) {
        std::cout << (settings.dry_run ? "Dry run complete." : "Zipping complete.") << std::endl;
    }
    return reported ? 0 : kExitRunFailed;
}
