#include "../../include/source_file.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <system_error>

namespace discpack {

namespace fs = std::filesystem;

SourceFile make_source_file(const fs::path& path) {
    SourceFile file;
    file.absolute_path = fs::absolute(path);
    file.relative_name = file.absolute_path.filename().generic_string();
    file.size_bytes = static_cast<std::uint64_t>(fs::file_size(file.absolute_path));
    return file;
}

std::vector<SourceFile> list_files_recursive(const fs::path& root) {
    std::vector<fs::path> paths;

    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied);
    for (; it != fs::recursive_directory_iterator(); ) {
        std::error_code ec;
        const bool regular = it->is_regular_file(ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't stat " + it->path().string() + " (" + ec.message() + ")", "scanner");
        } else if (regular && !it->is_symlink(ec)) {
            paths.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Directory walk stopped early under " + root.string() + " (" + ec.message() + ")", "scanner");
            break;
        }
    }

    std::ranges::sort(paths, [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    });

    std::vector<SourceFile> result;
    result.reserve(paths.size());
    for (const auto& p : paths) {
        try {
            result.push_back(make_source_file(p));
        } catch (const fs::filesystem_error& e) {
            Logger::log(LogLevel::Warning, "Skipping unreadable file: " + p.string() + " (" + e.code().message() + ")", "scanner");
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}

} // namespace discpack
