#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>
#include "cli/cli_runner.hpp"
#include "../libdiscpack/include/logger.hpp"
#include "test_helpers.hpp"

using namespace discpack;
using namespace discpack::test;

namespace {

int run(std::vector<std::string> args) {
    args.insert(args.begin(), "discpack");
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    return run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

class CliRunnerTest : public ::testing::Test {
protected:
    TempDir input;
    TempDir output;

    void TearDown() override {
        // run_cli installs console and file sinks for the process
        Logger::clear_sinks();
    }
};

TEST_F(CliRunnerTest, missing_output_argument_returns_normally) {
    write_file(input.path() / "a.txt", "alpha");
    EXPECT_EQ(run({"--input", input.path().string()}), 0);
    EXPECT_TRUE(std::filesystem::is_empty(output.path()));
}

TEST_F(CliRunnerTest, missing_input_argument_returns_normally) {
    const auto target = output.path() / "out";
    EXPECT_EQ(run({"--output", target.string()}), 0);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(CliRunnerTest, nonexistent_input_returns_normally) {
    const auto target = output.path() / "out";
    EXPECT_EQ(run({"--input", (input.path() / "nope").string(), "--output", target.string()}), 0);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(CliRunnerTest, splits_directory_and_writes_report) {
    write_sized_file(input.path() / "a.bin", 600 * 1024);
    write_sized_file(input.path() / "b.bin", 600 * 1024);
    const auto target = output.path() / "parts";
    const auto report = output.path() / "report.csv";

    EXPECT_EQ(run({"--input", input.path().string(), "--output", target.string(),
                   "--partsize", "1", "--quiet", "--report", report.string()}),
              0);

    EXPECT_TRUE(std::filesystem::exists(target / "archive_part000.zip"));
    EXPECT_TRUE(std::filesystem::exists(target / "archive_part001.zip"));
    EXPECT_FALSE(std::filesystem::exists(target / "archive_part002.zip"));
    EXPECT_TRUE(std::filesystem::exists(report));
}

TEST_F(CliRunnerTest, dry_run_creates_nothing) {
    write_file(input.path() / "a.txt", "alpha");
    const auto target = output.path() / "parts";
    EXPECT_EQ(run({"--input", input.path().string(), "--output", target.string(), "--dry-run", "--quiet"}), 0);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(CliRunnerTest, invalid_part_size_is_a_parse_error) {
    EXPECT_NE(run({"--input", input.path().string(), "--output", output.path().string(), "--partsize", "0"}), 0);
    EXPECT_TRUE(std::filesystem::is_empty(output.path()));
}
