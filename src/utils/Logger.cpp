#include "utils/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <vector>

namespace MediaBot {

std::shared_ptr<spdlog::logger> Logger::pipelineLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::downloaderLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::transcriberLogger = nullptr;

void Logger::initialize(const std::string& logDir) {
    if (pipelineLogger && downloaderLogger && transcriberLogger) {
        return;
    }

    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
        std::cerr << "Could not create log directory " << logDir << ": " << ec.message() << std::endl;
    }

    const std::filesystem::path dir(logDir);
    createLogger("pipeline", (dir / "pipeline_log.txt").string(), pipelineLogger);
    createLogger("downloader", (dir / "downloader_log.txt").string(), downloaderLogger);
    createLogger("transcriber", (dir / "transcriber_log.txt").string(), transcriberLogger);

    LOG_PIPE_INFO("Logging system initialized");
}

void Logger::createLogger(
    const std::string& name,
    const std::string& filename,
    std::shared_ptr<spdlog::logger>& logger
) {
    if (logger) {
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    std::vector<spdlog::sink_ptr> sinks{console_sink};

    try {
        // Rotating file sink: 10MB max size, 3 backup files
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, 1024 * 1024 * 10, 3
        );
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "File logging disabled for " << name << ": " << ex.what() << std::endl;
    }

    logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);

    // A logger with this name may survive from an earlier initialize()
    spdlog::drop(name);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Logger::getPipelineLogger() {
    if (!pipelineLogger) {
        initialize();
    }
    return pipelineLogger;
}

std::shared_ptr<spdlog::logger> Logger::getDownloaderLogger() {
    if (!downloaderLogger) {
        initialize();
    }
    return downloaderLogger;
}

std::shared_ptr<spdlog::logger> Logger::getTranscriberLogger() {
    if (!transcriberLogger) {
        initialize();
    }
    return transcriberLogger;
}

void Logger::shutdown() {
    if (pipelineLogger) {
        pipelineLogger->flush();
    }
    if (downloaderLogger) {
        downloaderLogger->flush();
    }
    if (transcriberLogger) {
        transcriberLogger->flush();
    }

    pipelineLogger.reset();
    downloaderLogger.reset();
    transcriberLogger.reset();
    spdlog::shutdown();
}

} // namespace MediaBot
