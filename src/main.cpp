#include "delivery/TelegramDelivery.hpp"
#include "media/MediaPipeline.hpp"
#include "media/ProxyPool.hpp"
#include "media/SourceResolver.hpp"
#include "models/Config.hpp"
#include "models/PipelineError.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include "utils/ProcessRunner.hpp"
#include "utils/UrlGuard.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

std::atomic<bool>* cancelRequested = nullptr;

void signalHandler(int) {
    if (cancelRequested) {
        cancelRequested->store(true);
    }
}

struct Options {
    std::string configFile = "config/config.json";
    bool configGiven = false;
    MediaBot::ExtractMode mode = MediaBot::ExtractMode::Text;
    std::optional<MediaBot::SubtitleFormat> subtitleFormat;
    std::optional<std::int64_t> chatId;
    std::string url;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config file] [--mode text|audio|video|all] [--subs text|srt|vtt] [--chat id] <url>\n";
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--config" && hasValue) {
            options.configFile = argv[++i];
            options.configGiven = true;
        } else if (arg == "--mode" && hasValue) {
            auto mode = MediaBot::stringToMode(argv[++i]);
            if (!mode) {
                std::cerr << "Unknown mode: " << argv[i] << "\n";
                return std::nullopt;
            }
            options.mode = *mode;
        } else if (arg == "--subs" && hasValue) {
            auto format = MediaBot::stringToSubtitleFormat(argv[++i]);
            if (!format) {
                std::cerr << "Unknown subtitle format: " << argv[i] << "\n";
                return std::nullopt;
            }
            options.subtitleFormat = *format;
        } else if (arg == "--chat" && hasValue) {
            try {
                options.chatId = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid chat id: " << argv[i] << "\n";
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (options.url.empty()) {
            options.url = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.url.empty()) {
        return std::nullopt;
    }
    return options;
}

nlohmann::json toJson(const MediaBot::ExtractResult& result) {
    nlohmann::json summary;
    summary["platform"] = MediaBot::platformToString(result.platform);
    summary["title"] = result.title;
    summary["url"] = result.url;
    summary["duration"] = result.duration ? nlohmann::json(*result.duration) : nlohmann::json(nullptr);
    if (result.transcript) summary["transcript"] = *result.transcript;
    if (result.subtitlePath) summary["subtitle_path"] = *result.subtitlePath;
    if (result.subtitleFormat) summary["subtitle_format"] = MediaBot::subtitleFormatToString(*result.subtitleFormat);
    if (result.audioPath) summary["audio_path"] = *result.audioPath;
    if (result.videoPath) summary["video_path"] = *result.videoPath;
    summary["warnings"] = result.warnings;
    return summary;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    // Load configuration: file first, environment as fallback
    auto& config = MediaBot::getConfig();
    bool configLoaded = config.loadFromFile(options->configFile);
    if (!configLoaded) {
        configLoaded = config.loadFromEnvironment();
    }

    MediaBot::Logger::initialize(config.logDir);
    LOG_PIPE_INFO("=== mediabot starting ===");

    if (!configLoaded) {
        if (options->configGiven) {
            LOG_PIPE_WARN("Could not load {}, using defaults", options->configFile);
        } else {
            LOG_PIPE_WARN("No configuration found, using defaults");
        }
    }

    if (options->mode != MediaBot::ExtractMode::Audio && options->mode != MediaBot::ExtractMode::Video &&
        config.transcription.apiKey.empty()) {
        LOG_PIPE_WARN("GROQ_API_KEY not set, speech-to-text will fail");
    }

    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    cancelRequested = cancelFlag.get();
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = 0;
    try {
        MediaBot::PosixCommandRunner runner(cancelFlag);
        MediaBot::CprHttpClient http;

        MediaBot::ProxyPool proxies;
        if (!config.tools.proxyListPath.empty() && !proxies.load(config.tools.proxyListPath)) {
            LOG_DL_WARN("Proxy list {} could not be read, continuing without proxies", config.tools.proxyListPath);
        }

        MediaBot::UrlGuard guard(config.allowPrivateNetworkUrls);
        MediaBot::UrlPredicate isAllowed = [&guard](const std::string& url) {
            return guard.isUrlAllowed(url);
        };

        MediaBot::RedditSourceResolver resolver(runner, isAllowed, config.tools.curl);
        MediaBot::MediaPipeline pipeline(runner, http, proxies, resolver, isAllowed,
                                         MediaBot::PipelineSettings::fromConfig(config));

        MediaBot::MediaRequest request;
        request.url = options->url;
        request.mode = options->mode;
        request.subtitleFormat = options->subtitleFormat;

        MediaBot::ExtractResult result = pipeline.run(request, [](const std::string& status) {
            LOG_PIPE_INFO("{}", status);
        });

        std::cout << toJson(result).dump(2) << std::endl;

        if (options->chatId) {
            if (config.telegramToken.empty()) {
                LOG_PIPE_ERROR("Bot token is empty, cannot deliver to chat {}", *options->chatId);
                exitCode = 1;
            } else {
                MediaBot::TelegramDelivery delivery(config.telegramToken);
                if (!delivery.initialize() || !delivery.deliver(*options->chatId, result)) {
                    exitCode = 1;
                }
            }
        }

        MediaBot::cleanupExtractResult(result);

    } catch (const MediaBot::PipelineError& e) {
        LOG_PIPE_ERROR("{}: {}", MediaBot::errorKindToString(e.kind()), e.what());
        nlohmann::json error;
        error["error"] = MediaBot::errorKindToString(e.kind());
        error["message"] = e.what();
        std::cout << error.dump(2) << std::endl;
        exitCode = e.kind() == MediaBot::ErrorKind::Cancelled ? 130 : 1;
    } catch (const std::exception& e) {
        LOG_PIPE_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        exitCode = 1;
    }

    cancelRequested = nullptr;
    LOG_PIPE_INFO("=== mediabot shutdown ===");
    MediaBot::Logger::shutdown();
    return exitCode;
}
