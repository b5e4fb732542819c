#ifndef DISCPACK_TEST_HELPERS_HPP
#define DISCPACK_TEST_HELPERS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "../libdiscpack/include/source_file.hpp"

namespace discpack::test {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

void write_file(const std::filesystem::path& p, const std::string& contents);

// File of `size` deterministic bytes with a short repeating period.
void write_sized_file(const std::filesystem::path& p, std::uint64_t size);

std::vector<unsigned char> read_binary(const std::filesystem::path& p);

// SourceFile without touching the disk, for planning tests.
SourceFile fake_file(const std::string& name, std::uint64_t size);

struct ZipEntry {
    std::string name;
    std::string data;
    std::int64_t mtime = 0; // seconds since the epoch
};

// Decodes a ZIP image with libarchive's reader.
std::vector<ZipEntry> read_zip(const std::vector<unsigned char>& image);

} // namespace discpack::test

#endif // DISCPACK_TEST_HELPERS_HPP
