#ifndef DISCPACK_CONSOLE_LOG_SINK_HPP
#define DISCPACK_CONSOLE_LOG_SINK_HPP

#include "../../../libdiscpack/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above a minimum level.
 *
 * Debug and Info go to stdout, Warning and Error to stderr.
 */
class ConsoleLogSink final : public discpack::ILogSink {
public:
    discpack::LogLevel min_level = discpack::LogLevel::Info;
    bool enabled = true;

    void log(const discpack::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using discpack::LogLevel;
        if (!enabled || static_cast<int>(level) < static_cast<int>(min_level)) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // DISCPACK_CONSOLE_LOG_SINK_HPP
