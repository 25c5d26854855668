/**
 * @file log_sink.hpp
 * @brief Log severity levels and the abstract sink interface.
 */

#ifndef ODMETA_LOG_SINK_HPP
#define ODMETA_LOG_SINK_HPP

#include <string_view>

namespace odmeta {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information
    Info,    ///< Normal operation (files unpacked, fields written)
    Warning, ///< Unexpected but recoverable states
    Error    ///< Failures that abort the current operation
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, test capture).
 * The Logger delegates to every installed sink.
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

} // namespace odmeta

#endif // ODMETA_LOG_SINK_HPP
