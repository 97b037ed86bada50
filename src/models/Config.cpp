#include "models/Config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace MediaBot {

std::unique_ptr<Config> Config::instance = nullptr;

Config::Config() {
    resetToDefaults();
}

Config& Config::getInstance() {
    if (!instance) {
        instance = std::unique_ptr<Config>(new Config());
    }
    return *instance;
}

void Config::resetToDefaults() {
    telegramToken.clear();

    transcription.apiKey.clear();
    transcription.endpoint = "https://api.groq.com/openai/v1/audio/transcriptions";
    transcription.model = "whisper-large-v3-turbo";
    transcription.language = "en";
    transcription.timeoutMs = 180000;
    transcription.maxFileMB = 25;
    transcription.chunkSeconds = 600;

    tools.curl = "curl";
    tools.ytdlp = "yt-dlp";
    tools.ffmpeg = "ffmpeg";
    tools.ffprobe = "ffprobe";
    tools.cookiesPath.clear();
    tools.proxyListPath.clear();

    timeouts.extractorMs = 180000;
    timeouts.streamSec = 120;
    timeouts.ffmpegMs = 120000;
    timeouts.compressMs = 300000;
    timeouts.probeMs = 15000;
    timeouts.manifestMs = 15000;

    maxVideoSizeMB = 50;
    twoPassTargetMB = 49;

    tempRoot.clear();
    archiveDir.clear();
    logDir = "logs";

    allowPrivateNetworkUrls = false;
}

bool Config::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        json config;
        file >> config;

        telegramToken = config.value("telegram_token", telegramToken);

        if (config.contains("transcription")) {
            const auto& tr = config["transcription"];
            transcription.apiKey = tr.value("api_key", transcription.apiKey);
            transcription.endpoint = tr.value("endpoint", transcription.endpoint);
            transcription.model = tr.value("model", transcription.model);
            transcription.language = tr.value("language", transcription.language);
            transcription.timeoutMs = tr.value("timeout_ms", transcription.timeoutMs);
            transcription.maxFileMB = tr.value("max_file_mb", transcription.maxFileMB);
            transcription.chunkSeconds = tr.value("chunk_seconds", transcription.chunkSeconds);
        }

        if (config.contains("tools")) {
            const auto& tl = config["tools"];
            tools.curl = tl.value("curl", tools.curl);
            tools.ytdlp = tl.value("ytdlp", tools.ytdlp);
            tools.ffmpeg = tl.value("ffmpeg", tools.ffmpeg);
            tools.ffprobe = tl.value("ffprobe", tools.ffprobe);
            tools.cookiesPath = tl.value("cookies_path", tools.cookiesPath);
            tools.proxyListPath = tl.value("proxy_list_path", tools.proxyListPath);
        }

        if (config.contains("timeouts")) {
            const auto& to = config["timeouts"];
            timeouts.extractorMs = to.value("extractor_ms", timeouts.extractorMs);
            timeouts.streamSec = to.value("stream_sec", timeouts.streamSec);
            timeouts.ffmpegMs = to.value("ffmpeg_ms", timeouts.ffmpegMs);
            timeouts.compressMs = to.value("compress_ms", timeouts.compressMs);
            timeouts.probeMs = to.value("probe_ms", timeouts.probeMs);
            timeouts.manifestMs = to.value("manifest_ms", timeouts.manifestMs);
        }

        maxVideoSizeMB = config.value("max_video_size_mb", maxVideoSizeMB);
        twoPassTargetMB = config.value("two_pass_target_mb", twoPassTargetMB);
        tempRoot = config.value("temp_root", tempRoot);
        archiveDir = config.value("archive_dir", archiveDir);
        logDir = config.value("log_dir", logDir);
        allowPrivateNetworkUrls = config.value("allow_private_network_urls", allowPrivateNetworkUrls);

        return true;
    } catch (const std::exception& e) {
        return false;
    }
}

bool Config::loadFromEnvironment() {
    telegramToken = getEnv("TELEGRAM_BOT_TOKEN", telegramToken);

    // Speech-to-text
    transcription.apiKey = getEnv("GROQ_API_KEY", transcription.apiKey);
    transcription.language = getEnv("VOICE_LANGUAGE", transcription.language);
    transcription.timeoutMs = getEnvInt("EXTRACT_TRANSCRIBE_TIMEOUT_MS", transcription.timeoutMs);
    transcription.maxFileMB = getEnvInt("TRANSCRIBE_MAX_FILE_MB", transcription.maxFileMB);
    transcription.chunkSeconds = getEnvInt("AUDIO_CHUNK_SECONDS", transcription.chunkSeconds);

    // Tools
    tools.cookiesPath = getEnv("YTDLP_COOKIES_PATH", tools.cookiesPath);
    tools.proxyListPath = getEnv("YTDLP_PROXY_LIST_PATH", tools.proxyListPath);

    // Timeouts
    timeouts.extractorMs = getEnvInt("YTDLP_TIMEOUT_MS", timeouts.extractorMs);
    timeouts.streamSec = getEnvInt("STREAM_TIMEOUT_SEC", timeouts.streamSec);
    timeouts.ffmpegMs = getEnvInt("FFMPEG_TIMEOUT_MS", timeouts.ffmpegMs);
    timeouts.compressMs = getEnvInt("COMPRESS_TIMEOUT_MS", timeouts.compressMs);

    // Limits
    maxVideoSizeMB = getEnvInt("REDDIT_VIDEO_MAX_SIZE_MB", maxVideoSizeMB);
    twoPassTargetMB = getEnvInt("TWO_PASS_TARGET_MB", twoPassTargetMB);

    // Filesystem
    tempRoot = getEnv("TEMP_ROOT", tempRoot);
    archiveDir = getEnv("ARCHIVE_DIR", archiveDir);
    logDir = getEnv("LOG_DIR", logDir);

    allowPrivateNetworkUrls = getEnvBool("ALLOW_PRIVATE_NETWORK_URLS", allowPrivateNetworkUrls);

    return !transcription.apiKey.empty() || !telegramToken.empty();
}

std::string Config::getEnv(const std::string& key, const std::string& defaultValue) const {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : defaultValue;
}

int64_t Config::getEnvInt(const std::string& key, int64_t defaultValue) const {
    const char* value = std::getenv(key.c_str());
    if (!value) return defaultValue;

    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

bool Config::getEnvBool(const std::string& key, bool defaultValue) const {
    const char* value = std::getenv(key.c_str());
    if (!value) return defaultValue;

    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower == "true" || lower == "1" || lower == "yes";
}

} // namespace MediaBot
