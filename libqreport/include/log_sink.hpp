/**
 * @file log_sink.hpp
 * @brief Log severity levels and the sink interface used by Logger.
 */

#ifndef QREPORT_LOG_SINK_HPP
#define QREPORT_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< General informational messages about normal operation
    Warning, ///< Recoverable problems (e.g. a photo that could not be exported)
    Error    ///< Failures that abort an export run
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define how log messages are delivered
 * (console, file, observer bridge). The Logger class fans out to every
 * installed sink.
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

#endif // QREPORT_LOG_SINK_HPP
