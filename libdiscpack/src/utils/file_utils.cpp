#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <system_error>

namespace discpack {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths, so non-ASCII names survive
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // long path prefix bypasses MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::filesystem::path make_temp_file_path(const std::string& prefix, const std::string& extension) {
        const auto base_tmp = std::filesystem::temp_directory_path();

        std::error_code ec;
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = base_tmp / ("discpack-" + prefix + "_" + RandomUtils::random_suffix() + extension);
            if (!std::filesystem::exists(candidate, ec)) {
                return candidate;
            }
        }
        return base_tmp / ("discpack-" + prefix + "_" + RandomUtils::random_suffix() + extension);
    }

    bool remove_file_quietly(const std::filesystem::path& file, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove file: " + file.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed file: " + file.string(), tag);
        return true;
    }

} // namespace discpack
