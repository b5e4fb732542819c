#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include "../libdiscpack/include/events.hpp"
#include "../libdiscpack/include/part_executor.hpp"
#include "test_helpers.hpp"

using namespace discpack;
using namespace discpack::test;

namespace {

constexpr std::uint64_t KB = 1024;

MemoryProbe fixed(const std::optional<std::uint64_t> value) {
    return [value]() { return value; };
}

struct Recorder {
    std::vector<std::string> trace;
    std::vector<PartPlannedEvent> planned;
    std::vector<PartBufferSelectedEvent> selected;
    std::vector<PartWriteCompleteEvent> written;
    std::vector<PartErrorEvent> errors;

    void attach(EventBus& bus) {
        bus.subscribe<PartPlannedEvent>([this](const PartPlannedEvent& e) {
            planned.push_back(e);
            trace.push_back("planned " + std::to_string(e.index));
        });
        bus.subscribe<PartBufferSelectedEvent>([this](const PartBufferSelectedEvent& e) {
            selected.push_back(e);
            trace.push_back("selected " + std::to_string(e.index));
        });
        bus.subscribe<PartCompressedEvent>([this](const PartCompressedEvent& e) {
            trace.push_back("compressed " + std::to_string(e.index));
        });
        bus.subscribe<PartWriteCompleteEvent>([this](const PartWriteCompleteEvent& e) {
            written.push_back(e);
            trace.push_back("written " + std::to_string(e.index));
        });
        bus.subscribe<PartErrorEvent>([this](const PartErrorEvent& e) {
            errors.push_back(e);
            trace.push_back("error " + std::to_string(e.index));
        });
    }
};

} // namespace

class PartExecutorTest : public ::testing::Test {
protected:
    TempDir input;
    TempDir output;
    EventBus bus;
    Recorder recorder;
    ArchiveBuilder builder;

    void SetUp() override { recorder.attach(bus); }

    PartBudget budget(const std::uint64_t part_size, const std::uint64_t threshold = 100 * KB) const {
        return PartBudget{part_size, threshold};
    }
};

TEST_F(PartExecutorTest, three_files_make_two_parts_in_order) {
    write_sized_file(input.path() / "1.bin", 40 * KB);
    write_sized_file(input.path() / "2.bin", 40 * KB);
    write_sized_file(input.path() / "3.bin", 40 * KB);

    const BufferSelector selector(fixed(1ULL << 40));
    PartExecutor executor(selector, builder, budget(100 * KB), output.path(), bus);
    const auto artifacts = executor.run(list_files_recursive(input.path()));

    ASSERT_EQ(artifacts.size(), 2u);
    EXPECT_EQ(artifacts[0].path, output.path() / "archive_part000.zip");
    EXPECT_EQ(artifacts[1].path, output.path() / "archive_part001.zip");

    const auto first = read_zip(read_binary(artifacts[0].path));
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].name, "1.bin");
    EXPECT_EQ(first[1].name, "2.bin");
    const auto second = read_zip(read_binary(artifacts[1].path));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].name, "3.bin");
    EXPECT_EQ(second[0].data.size(), 40 * KB);

    const std::vector<std::string> expected = {
        "planned 0", "selected 0", "compressed 0", "written 0",
        "planned 1", "selected 1", "compressed 1", "written 1",
    };
    EXPECT_EQ(recorder.trace, expected);
    EXPECT_EQ(recorder.written[0].file_count, 2u);
    EXPECT_EQ(recorder.written[0].input_bytes, 80 * KB);
    EXPECT_EQ(recorder.written[0].archive_bytes, std::filesystem::file_size(artifacts[0].path));
}

TEST_F(PartExecutorTest, oversized_file_is_written_alone) {
    write_sized_file(input.path() / "huge.bin", 150 * KB);

    const BufferSelector selector(fixed(0));
    PartExecutor executor(selector, builder, budget(100 * KB), output.path(), bus);
    const auto artifacts = executor.run(list_files_recursive(input.path()));

    ASSERT_EQ(artifacts.size(), 1u);
    ASSERT_EQ(recorder.planned.size(), 1u);
    EXPECT_TRUE(recorder.planned[0].oversized);
    EXPECT_EQ(recorder.planned[0].input_bytes, 150 * KB);
    const auto entries = read_zip(read_binary(artifacts[0].path));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].data.size(), 150 * KB);
}

TEST_F(PartExecutorTest, empty_input_writes_nothing) {
    const BufferSelector selector(fixed(0));
    PartExecutor executor(selector, builder, budget(100 * KB), output.path(), bus);
    const auto artifacts = executor.run(std::vector<SourceFile>{});

    EXPECT_TRUE(artifacts.empty());
    EXPECT_TRUE(recorder.trace.empty());
    EXPECT_TRUE(std::filesystem::is_empty(output.path()));
}

TEST_F(PartExecutorTest, buffer_kind_follows_memory_reading_per_part) {
    write_sized_file(input.path() / "a.bin", 60 * KB);
    write_sized_file(input.path() / "b.bin", 60 * KB);
    write_sized_file(input.path() / "c.bin", 60 * KB);

    // plenty of memory for the first part, then pressure
    std::vector<std::uint64_t> readings = {1ULL << 30, 1, 1ULL << 30};
    std::size_t call = 0;
    const BufferSelector selector([&]() -> std::optional<std::uint64_t> { return readings.at(call++); });
    PartExecutor executor(selector, builder, budget(100 * KB, 1024), output.path(), bus);
    const auto artifacts = executor.run(list_files_recursive(input.path()));

    ASSERT_EQ(artifacts.size(), 3u);
    ASSERT_EQ(recorder.selected.size(), 3u);
    EXPECT_EQ(recorder.selected[0].kind, BufferKind::Memory);
    EXPECT_EQ(recorder.selected[1].kind, BufferKind::Disk);
    EXPECT_EQ(recorder.selected[2].kind, BufferKind::Memory);
    EXPECT_TRUE(recorder.selected[0].staging_path.empty());
    EXPECT_FALSE(recorder.selected[1].staging_path.empty());
    EXPECT_FALSE(std::filesystem::exists(recorder.selected[1].staging_path));

    // same bytes whichever buffer staged them
    const auto via_memory = read_zip(read_binary(artifacts[0].path));
    const auto via_disk = read_zip(read_binary(artifacts[1].path));
    ASSERT_EQ(via_memory.size(), 1u);
    ASSERT_EQ(via_disk.size(), 1u);
    EXPECT_EQ(via_memory[0].data, via_disk[0].data);
}

TEST_F(PartExecutorTest, unreadable_file_aborts_the_run) {
    write_sized_file(input.path() / "ok.bin", 10 * KB);
    auto files = list_files_recursive(input.path());
    SourceFile ghost = files[0];
    ghost.absolute_path = input.path() / "vanished.bin";
    ghost.relative_name = "vanished.bin";
    files.push_back(ghost);
    write_sized_file(input.path() / "later.bin", 10 * KB);
    files.push_back(make_source_file(input.path() / "later.bin"));

    const BufferSelector selector(fixed(0));
    // budget 15 KB: [ok], [vanished], [later]
    PartExecutor executor(selector, builder, budget(15 * KB), output.path(), bus);
    EXPECT_THROW(executor.run(files), ArchiveError);

    ASSERT_EQ(recorder.errors.size(), 1u);
    EXPECT_EQ(recorder.errors[0].index, 1u);

    // the failed part was staged on disk and its temp file is gone
    ASSERT_EQ(recorder.selected.size(), 2u);
    EXPECT_EQ(recorder.selected[1].kind, BufferKind::Disk);
    ASSERT_FALSE(recorder.selected[1].staging_path.empty());
    EXPECT_FALSE(std::filesystem::exists(recorder.selected[1].staging_path));
    EXPECT_TRUE(std::filesystem::exists(output.path() / "archive_part000.zip"));
    EXPECT_FALSE(std::filesystem::exists(output.path() / "archive_part001.zip"));
    EXPECT_FALSE(std::filesystem::exists(output.path() / "archive_part002.zip"));
}

TEST_F(PartExecutorTest, dry_run_plans_without_writing) {
    write_sized_file(input.path() / "a.bin", 60 * KB);
    write_sized_file(input.path() / "b.bin", 60 * KB);

    int probe_calls = 0;
    const BufferSelector selector([&]() -> std::optional<std::uint64_t> { ++probe_calls; return 0; });
    PartExecutor executor(selector, builder, budget(100 * KB), output.path(), bus, true);
    const auto artifacts = executor.run(list_files_recursive(input.path()));

    EXPECT_TRUE(artifacts.empty());
    EXPECT_EQ(recorder.planned.size(), 2u);
    EXPECT_TRUE(recorder.selected.empty());
    EXPECT_EQ(probe_calls, 0);
    EXPECT_TRUE(std::filesystem::is_empty(output.path()));
}
