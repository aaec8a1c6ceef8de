#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace Hullgen {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Owns the library logger ("HULLGEN") and the command-line tool logger
 * ("TOOL"). Both share the same sinks. If Initialize() was never called the
 * loggers are created on first use with a console sink only.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger>& GetLibraryLogger();

    /**
     * @brief Get the command-line tool logger
     */
    static std::shared_ptr<spdlog::logger>& GetToolLogger();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_libraryLogger;
    static std::shared_ptr<spdlog::logger> s_toolLogger;
    static bool s_initialized;
};

} // namespace Hullgen

// Convenience macros for library logging
#define HULLGEN_LOG_TRACE(...)    ::Hullgen::Logger::GetLibraryLogger()->trace(__VA_ARGS__)
#define HULLGEN_LOG_DEBUG(...)    ::Hullgen::Logger::GetLibraryLogger()->debug(__VA_ARGS__)
#define HULLGEN_LOG_INFO(...)     ::Hullgen::Logger::GetLibraryLogger()->info(__VA_ARGS__)
#define HULLGEN_LOG_WARN(...)     ::Hullgen::Logger::GetLibraryLogger()->warn(__VA_ARGS__)
#define HULLGEN_LOG_ERROR(...)    ::Hullgen::Logger::GetLibraryLogger()->error(__VA_ARGS__)
#define HULLGEN_LOG_CRITICAL(...) ::Hullgen::Logger::GetLibraryLogger()->critical(__VA_ARGS__)

// Convenience macros for command-line tool logging
#define TOOL_LOG_TRACE(...)    ::Hullgen::Logger::GetToolLogger()->trace(__VA_ARGS__)
#define TOOL_LOG_DEBUG(...)    ::Hullgen::Logger::GetToolLogger()->debug(__VA_ARGS__)
#define TOOL_LOG_INFO(...)     ::Hullgen::Logger::GetToolLogger()->info(__VA_ARGS__)
#define TOOL_LOG_WARN(...)     ::Hullgen::Logger::GetToolLogger()->warn(__VA_ARGS__)
#define TOOL_LOG_ERROR(...)    ::Hullgen::Logger::GetToolLogger()->error(__VA_ARGS__)
#define TOOL_LOG_CRITICAL(...) ::Hullgen::Logger::GetToolLogger()->critical(__VA_ARGS__)
