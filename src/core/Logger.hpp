/**
 * @file Logger.hpp
 * @brief Library-wide spdlog logger.
 *
 * One named spdlog logger shared by every module. Output goes to stderr so a
 * host writing alignments to stdout keeps a clean stream; a rotating file sink
 * is added when a log file is given. The logger is created on first use from
 * the [general] debug flag and [log] file of the active Config, or explicitly
 * with init().
 *
 * Codecs and Alignment log at debug (loads, saves, dropped records) and trace
 * (parse summaries). Failures are returned as Result errors, not only logged.
 *
 * @section Dependencies
 * - spdlog
 * - Config (lazy initialization)
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace pa {

class Logger {
public:
    // Replaces any logger created earlier. An empty logFile logs to stderr
    // only.
    static void init(std::string_view appName = "phonalign",
                     bool debug = false,
                     const std::filesystem::path& logFile = {});

    // init() with the debug flag and log file of the active Config
    static void initFromConfig();

    static void shutdown();

    static bool isInitialized() {
        return logger_ != nullptr;
    }

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(pa::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(pa::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(pa::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(pa::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(pa::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(pa::Logger::get(), __VA_ARGS__)

} // namespace pa
