#ifndef ODMETA_CONSOLE_LOG_SINK_HPP
#define ODMETA_CONSOLE_LOG_SINK_HPP

#include "../../../libodmeta/include/log_sink.hpp"
#include <iostream>

class ConsoleLogSink final : public odmeta::ILogSink {
public:
    // messages below this level are dropped
    odmeta::LogLevel log_level = odmeta::LogLevel::Error;

    void log(const odmeta::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        switch (level) {
            case odmeta::LogLevel::Debug:
                std::cerr << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case odmeta::LogLevel::Info:
                std::cerr << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case odmeta::LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case odmeta::LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // ODMETA_CONSOLE_LOG_SINK_HPP
