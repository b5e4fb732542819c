#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../libdiscpack/include/discpack.hpp"
#include "../libdiscpack/include/logger.hpp"
#include "test_helpers.hpp"

using namespace discpack;
using namespace discpack::test;

namespace {

constexpr std::uint64_t KB = 1024;

class RecordingObserver final : public DiscPackObserver {
public:
    std::vector<std::size_t> started;
    std::vector<OutputArtifact> finished;
    std::vector<bool> memory_flags;
    std::vector<std::string> errors;
    int log_lines = 0;

    void onPartStart(const std::size_t index, std::size_t, std::uint64_t) override {
        started.push_back(index);
    }

    void onPartFinish(const OutputArtifact& artifact, const bool memory_buffered) override {
        finished.push_back(artifact);
        memory_flags.push_back(memory_buffered);
    }

    void onPartError(std::size_t, const std::string& error) override {
        errors.push_back(error);
    }

    void onLog(int, const std::string&, const std::string&) override {
        ++log_lines;
    }
};

} // namespace

class DiscPackTest : public ::testing::Test {
protected:
    TempDir input;
    TempDir output;
};

TEST_F(DiscPackTest, packs_directory_into_parts) {
    write_sized_file(input.path() / "a.bin", 30 * KB);
    write_sized_file(input.path() / "b.bin", 30 * KB);
    write_sized_file(input.path() / "sub" / "c.bin", 30 * KB);

    DiscPack packer;
    packer.partSize(64 * KB)
          .memoryThreshold(0)
          .outputDirectory(output.path())
          .memoryProbe([] { return std::optional<std::uint64_t>(1ULL << 30); });

    const auto artifacts = packer.pack(input.path());

    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(artifacts[0].part_index, 0u);
    EXPECT_EQ(artifacts[1].part_index, 1u);
    for (const auto& artifact : artifacts) {
        EXPECT_TRUE(std::filesystem::exists(artifact.path));
        EXPECT_EQ(artifact.size_bytes, std::filesystem::file_size(artifact.path));
    }

    // scan order is a.bin, b.bin, sub/c.bin
    const auto first = read_zip(read_binary(artifacts[0].path));
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].name, "a.bin");
    EXPECT_EQ(first[1].name, "b.bin");
    const auto second = read_zip(read_binary(artifacts[1].path));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].name, "c.bin");
}

TEST_F(DiscPackTest, creates_missing_output_directory) {
    write_file(input.path() / "note.txt", "hello");
    const auto target = output.path() / "nested" / "out";

    DiscPack packer;
    packer.outputDirectory(target);
    const auto artifacts = packer.pack(input.path());

    ASSERT_EQ(artifacts.size(), 1u);
    EXPECT_TRUE(std::filesystem::is_directory(target));
    EXPECT_EQ(artifacts[0].path, target / "archive_part000.zip");
}

TEST_F(DiscPackTest, missing_input_directory_is_rejected) {
    DiscPack packer;
    packer.outputDirectory(output.path());
    EXPECT_THROW(packer.pack(input.path() / "nope"), std::invalid_argument);
}

TEST_F(DiscPackTest, regular_file_as_input_is_rejected) {
    write_file(input.path() / "file.txt", "x");
    DiscPack packer;
    packer.outputDirectory(output.path());
    EXPECT_THROW(packer.pack(input.path() / "file.txt"), std::invalid_argument);
}

TEST_F(DiscPackTest, zero_part_size_is_rejected) {
    write_file(input.path() / "a.txt", "a");
    DiscPack packer;
    packer.partSize(0).outputDirectory(output.path());
    EXPECT_THROW(packer.pack(input.path()), std::invalid_argument);
}

TEST_F(DiscPackTest, output_directory_is_required) {
    write_file(input.path() / "a.txt", "a");
    DiscPack packer;
    EXPECT_THROW(packer.pack(input.path()), std::invalid_argument);
}

TEST_F(DiscPackTest, invalid_compression_level_is_rejected) {
    write_file(input.path() / "a.txt", "a");
    DiscPack packer;
    packer.outputDirectory(output.path()).compressionLevel(12);
    EXPECT_THROW(packer.pack(input.path()), std::invalid_argument);
}

TEST_F(DiscPackTest, observer_sees_every_part) {
    write_sized_file(input.path() / "a.bin", 50 * KB);
    write_sized_file(input.path() / "b.bin", 50 * KB);

    RecordingObserver observer;
    DiscPack packer;
    packer.partSize(64 * KB)
          .memoryThreshold(100 * KB)
          .outputDirectory(output.path())
          .memoryProbe([] { return std::optional<std::uint64_t>(10 * KB); });
    packer.setObserver(&observer);

    const auto artifacts = packer.pack(input.path());

    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(observer.started, (std::vector<std::size_t>{0, 1}));
    ASSERT_EQ(observer.finished.size(), 2u);
    EXPECT_EQ(observer.finished[1].path, artifacts[1].path);
    // 10 KB free is below the 100 KB threshold
    EXPECT_EQ(observer.memory_flags, (std::vector<bool>{false, false}));
    EXPECT_TRUE(observer.errors.empty());
    EXPECT_GT(observer.log_lines, 0);
}

TEST_F(DiscPackTest, observer_hears_about_failures) {
    write_file(input.path() / "a.txt", "alpha");
    auto files = list_files_recursive(input.path());
    files.push_back(SourceFile{input.path() / "gone.txt", "gone.txt", 5});

    RecordingObserver observer;
    DiscPack packer;
    packer.partSize(4).outputDirectory(output.path());
    packer.setObserver(&observer);

    EXPECT_ANY_THROW(packer.pack(files));
    EXPECT_EQ(observer.finished.size(), 1u);
    ASSERT_EQ(observer.errors.size(), 1u);
}

TEST_F(DiscPackTest, dry_run_leaves_output_untouched) {
    write_sized_file(input.path() / "a.bin", 50 * KB);
    write_sized_file(input.path() / "b.bin", 50 * KB);
    const auto target = output.path() / "never";

    RecordingObserver observer;
    DiscPack packer;
    packer.partSize(64 * KB).outputDirectory(target).dryRun(true);
    packer.setObserver(&observer);

    const auto artifacts = packer.pack(input.path());

    EXPECT_TRUE(artifacts.empty());
    EXPECT_EQ(observer.started.size(), 2u);
    EXPECT_TRUE(observer.finished.empty());
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(DiscPackTest, empty_directory_yields_no_parts) {
    DiscPack packer;
    packer.outputDirectory(output.path());
    EXPECT_TRUE(packer.pack(input.path()).empty());
    EXPECT_TRUE(std::filesystem::is_empty(output.path()));
}

TEST_F(DiscPackTest, observer_stops_hearing_logs_after_pack) {
    write_file(input.path() / "a.txt", "alpha");

    RecordingObserver observer;
    DiscPack packer;
    packer.outputDirectory(output.path()).dryRun(true);
    packer.setObserver(&observer);
    ASSERT_NO_THROW(packer.pack(input.path()));

    const int during_run = observer.log_lines;
    EXPECT_GT(during_run, 0);
    Logger::log(LogLevel::Info, "unrelated message");
    EXPECT_EQ(observer.log_lines, during_run);
}

TEST_F(DiscPackTest, destroyed_observer_is_never_called) {
    write_file(input.path() / "a.txt", "alpha");

    auto observer = std::make_unique<RecordingObserver>();
    {
        DiscPack packer;
        packer.outputDirectory(output.path()).dryRun(true);
        packer.setObserver(observer.get());
        ASSERT_NO_THROW(packer.pack(input.path()));
    }
    observer.reset();

    // would reach freed memory if the bridge outlived the run
    EXPECT_NO_THROW(Logger::log(LogLevel::Info, "later message"));
}

TEST_F(DiscPackTest, replaced_observer_receives_next_run_logs) {
    write_file(input.path() / "a.txt", "alpha");

    RecordingObserver first;
    RecordingObserver second;
    DiscPack packer;
    packer.outputDirectory(output.path()).dryRun(true);

    packer.setObserver(&first);
    ASSERT_NO_THROW(packer.pack(input.path()));
    const int first_lines = first.log_lines;

    packer.setObserver(&second);
    ASSERT_NO_THROW(packer.pack(input.path()));

    EXPECT_EQ(first.log_lines, first_lines);
    EXPECT_GT(second.log_lines, 0);
    EXPECT_EQ(second.started.size(), 1u);
}
