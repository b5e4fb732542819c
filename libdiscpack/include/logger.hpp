/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of the library logs through Logger::log with a
 * component tag. The front end decides where messages end up by
 * registering one or more ILogSink implementations.
 */

#ifndef DISCPACK_LOGGER_HPP
#define DISCPACK_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace discpack {

/**
 * @brief Static logging facade for discpack.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove one previously added sink, destroying it.
     * @param sink The sink to drop. Unknown pointers are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "discpack").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "discpack");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-insensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "DEBUG", "INFO").
     * @return The corresponding LogLevel enum.
     */
    static LogLevel string_to_level(const std::string& level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

} // namespace discpack

#endif // DISCPACK_LOGGER_HPP
