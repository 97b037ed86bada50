#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace MediaBot {

/**
 * Logger utility class
 * Provides named loggers writing to console and rotating files
 */
class Logger {
public:
    // Initialize logging system (creates logDir if missing)
    static void initialize(const std::string& logDir = "logs");

    // Get loggers
    static std::shared_ptr<spdlog::logger> getPipelineLogger();
    static std::shared_ptr<spdlog::logger> getDownloaderLogger();
    static std::shared_ptr<spdlog::logger> getTranscriberLogger();

    // Shutdown logging system
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> pipelineLogger;
    static std::shared_ptr<spdlog::logger> downloaderLogger;
    static std::shared_ptr<spdlog::logger> transcriberLogger;

    static void createLogger(
        const std::string& name,
        const std::string& filename,
        std::shared_ptr<spdlog::logger>& logger
    );
};

// Convenience macros
#define LOG_PIPE_INFO(...)   MediaBot::Logger::getPipelineLogger()->info(__VA_ARGS__)
#define LOG_PIPE_WARN(...)   MediaBot::Logger::getPipelineLogger()->warn(__VA_ARGS__)
#define LOG_PIPE_ERROR(...)  MediaBot::Logger::getPipelineLogger()->error(__VA_ARGS__)
#define LOG_PIPE_DEBUG(...)  MediaBot::Logger::getPipelineLogger()->debug(__VA_ARGS__)

#define LOG_DL_INFO(...)     MediaBot::Logger::getDownloaderLogger()->info(__VA_ARGS__)
#define LOG_DL_WARN(...)     MediaBot::Logger::getDownloaderLogger()->warn(__VA_ARGS__)
#define LOG_DL_ERROR(...)    MediaBot::Logger::getDownloaderLogger()->error(__VA_ARGS__)
#define LOG_DL_DEBUG(...)    MediaBot::Logger::getDownloaderLogger()->debug(__VA_ARGS__)

#define LOG_ASR_INFO(...)    MediaBot::Logger::getTranscriberLogger()->info(__VA_ARGS__)
#define LOG_ASR_WARN(...)    MediaBot::Logger::getTranscriberLogger()->warn(__VA_ARGS__)
#define LOG_ASR_ERROR(...)   MediaBot::Logger::getTranscriberLogger()->error(__VA_ARGS__)

} // namespace MediaBot
