#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Hullgen {

std::shared_ptr<spdlog::logger> Logger::s_libraryLogger;
std::shared_ptr<spdlog::logger> Logger::s_toolLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_libraryLogger = std::make_shared<spdlog::logger>("HULLGEN", sinks.begin(), sinks.end());
    s_libraryLogger->set_level(spdlog::level::info);
    s_libraryLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_libraryLogger);

    s_toolLogger = std::make_shared<spdlog::logger>("TOOL", sinks.begin(), sinks.end());
    s_toolLogger->set_level(spdlog::level::info);
    s_toolLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_toolLogger);

    spdlog::set_default_logger(s_libraryLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_libraryLogger->flush();
    s_toolLogger->flush();

    spdlog::drop_all();

    s_libraryLogger.reset();
    s_toolLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetLibraryLogger()->set_level(level);
    GetToolLogger()->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logger::GetLibraryLogger() {
    if (!s_libraryLogger) {
        Initialize();
    }
    return s_libraryLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetToolLogger() {
    if (!s_toolLogger) {
        Initialize();
    }
    return s_toolLogger;
}

} // namespace Hullgen
