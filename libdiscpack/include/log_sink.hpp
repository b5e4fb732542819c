/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by the Logger facade.
 */

#ifndef DISCPACK_LOG_SINK_HPP
#define DISCPACK_LOG_SINK_HPP

#include <string_view>

namespace discpack {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-entry and per-buffer diagnostics
    Info,    ///< Normal progress (parts planned, written)
    Warning, ///< Recoverable oddities (memory probe failed, unreadable dir entry)
    Error    ///< Failures that abort the run
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, observer).
 * The Logger class fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace discpack

#endif // DISCPACK_LOG_SINK_HPP
