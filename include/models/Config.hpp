#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace MediaBot {

using json = nlohmann::json;

/**
 * Configuration management class
 * Loads configuration from JSON file and environment variables
 */
class Config {
public:
    // Delivery
    std::string telegramToken;

    // Speech-to-text (Groq Whisper)
    struct Transcription {
        std::string apiKey;
        std::string endpoint;
        std::string model;
        std::string language;
        int64_t timeoutMs;
        int64_t maxFileMB;          // provider per-request ceiling
        int64_t chunkSeconds;
    } transcription;

    // External tools
    struct Tools {
        std::string curl;
        std::string ytdlp;
        std::string ffmpeg;
        std::string ffprobe;
        std::string cookiesPath;    // passed to yt-dlp when the file exists
        std::string proxyListPath;  // newline-delimited, '#' comments
    } tools;

    // Timeouts
    struct Timeouts {
        int64_t extractorMs;
        int64_t streamSec;
        int64_t ffmpegMs;
        int64_t compressMs;
        int64_t probeMs;
        int64_t manifestMs;
    } timeouts;

    // Size limits
    int64_t maxVideoSizeMB;
    int64_t twoPassTargetMB;

    // Filesystem
    std::string tempRoot;           // empty = system temp directory
    std::string archiveDir;         // empty = inside the run's temp directory
    std::string logDir;

    bool allowPrivateNetworkUrls;

    // Singleton pattern
    static Config& getInstance();

    // Load configuration
    bool loadFromFile(const std::string& filename);
    bool loadFromEnvironment();

    // Restore built-in defaults
    void resetToDefaults();

    ~Config() = default;

private:
    Config();

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Helper methods
    std::string getEnv(const std::string& key, const std::string& defaultValue = "") const;
    int64_t getEnvInt(const std::string& key, int64_t defaultValue = 0) const;
    bool getEnvBool(const std::string& key, bool defaultValue = false) const;

    static std::unique_ptr<Config> instance;
};

/**
 * Get global configuration instance
 */
inline Config& getConfig() {
    return Config::getInstance();
}

} // namespace MediaBot
