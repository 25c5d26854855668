/**
 * @file logger.hpp
 * @brief Process-wide logging facade shared by the library and the CLI.
 */

#ifndef ODMETA_LOGGER_HPP
#define ODMETA_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace odmeta {

/**
 * @brief Fans log records out to the installed sinks.
 *
 * @details Components call log() with their own tag ("ArchiveCodec",
 * "MetadataMapper", ...). Nothing is printed until a sink is installed,
 * so the library stays silent when embedded. All members are static and
 * guarded by one mutex.
 */
class Logger {
public:
    /// Takes ownership of @p sink. Null sinks are ignored.
    static void add_sink(std::unique_ptr<ILogSink> sink);

    static void clear_sinks();

    static void log(LogLevel level, std::string_view msg, std::string_view tag = "odmeta");

    /// "DEBUG", "INFO", "WARN" or "ERROR".
    [[nodiscard]] static const char* level_to_string(LogLevel level);

    /**
     * @brief Parses a --log-level value.
     * @return The matching level; anything unknown maps to LogLevel::Error.
     */
    [[nodiscard]] static LogLevel string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace odmeta

#endif // ODMETA_LOGGER_HPP
