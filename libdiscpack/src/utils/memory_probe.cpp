#include "../../include/memory_probe.hpp"

#if defined(_WIN32)
#include <windows.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/mach_host.h>
#include <unistd.h>
#else
#include <sys/sysinfo.h>
#include <cstdio>
#include <cstring>
#endif

namespace discpack {

#if defined(__linux__)
namespace {

// value in kB of the "MemAvailable:" line, if present
std::optional<std::uint64_t> read_meminfo_available() {
    FILE* f = std::fopen("/proc/meminfo", "r");
    if (!f) return std::nullopt;

    std::optional<std::uint64_t> result;
    char line[256];
    while (std::fgets(line, sizeof(line), f)) {
        unsigned long long kb = 0;
        if (std::sscanf(line, "MemAvailable: %llu kB", &kb) == 1) {
            result = static_cast<std::uint64_t>(kb) * 1024;
            break;
        }
    }
    std::fclose(f);
    return result;
}

} // namespace
#endif

std::optional<std::uint64_t> query_available_memory() noexcept {
#if defined(_WIN32)
    MEMORYSTATUSEX status{};
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(status.ullAvailPhys);
#elif defined(__APPLE__)
    vm_statistics64_data_t stats{};
    mach_msg_type_number_t count = HOST_VM_INFO64_COUNT;
    if (host_statistics64(mach_host_self(), HOST_VM_INFO64,
                          reinterpret_cast<host_info64_t>(&stats), &count) != KERN_SUCCESS) {
        return std::nullopt;
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return std::nullopt;
    }
    return (static_cast<std::uint64_t>(stats.free_count) + stats.inactive_count) *
           static_cast<std::uint64_t>(page_size);
#else
#if defined(__linux__)
    if (auto available = read_meminfo_available()) {
        return available;
    }
#endif
    struct sysinfo info{};
    if (sysinfo(&info) != 0) {
        return std::nullopt;
    }
    return (static_cast<std::uint64_t>(info.freeram) + info.bufferram) * info.mem_unit;
#endif
}

} // namespace discpack
