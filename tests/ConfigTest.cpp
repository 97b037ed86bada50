#include <gtest/gtest.h>
#include "FakeTools.hpp"
#include "media/MediaPipeline.hpp"
#include "models/Config.hpp"
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;
using namespace MediaBot;

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / "mediabot_config_test";
        fs::create_directories(dir_);
        clearEnvironment();
        getConfig().resetToDefaults();
    }

    void TearDown() override
    {
        clearEnvironment();
        getConfig().resetToDefaults();
        fs::remove_all(dir_);
    }

    static void clearEnvironment()
    {
        for (const char* key : {"GROQ_API_KEY", "TELEGRAM_BOT_TOKEN", "VOICE_LANGUAGE",
                                "REDDIT_VIDEO_MAX_SIZE_MB", "AUDIO_CHUNK_SECONDS",
                                "ALLOW_PRIVATE_NETWORK_URLS", "YTDLP_PROXY_LIST_PATH"})
        {
            unsetenv(key);
        }
    }

    fs::path dir_;
};

TEST_F(ConfigTest, DefaultsMatchProviderLimits)
{
    const Config& config = getConfig();
    EXPECT_EQ(config.transcription.endpoint, "https://api.groq.com/openai/v1/audio/transcriptions");
    EXPECT_EQ(config.transcription.model, "whisper-large-v3-turbo");
    EXPECT_EQ(config.transcription.language, "en");
    EXPECT_EQ(config.transcription.timeoutMs, 180000);
    EXPECT_EQ(config.transcription.maxFileMB, 25);
    EXPECT_EQ(config.transcription.chunkSeconds, 600);
    EXPECT_EQ(config.maxVideoSizeMB, 50);
    EXPECT_EQ(config.twoPassTargetMB, 49);
    EXPECT_EQ(config.timeouts.streamSec, 120);
    EXPECT_FALSE(config.allowPrivateNetworkUrls);
}

TEST_F(ConfigTest, LoadsNestedJsonFile)
{
    const fs::path file = dir_ / "config.json";
    Testing::writeFile(file, R"({
        "telegram_token": "123:abc",
        "transcription": { "api_key": "gsk_test", "language": "de", "chunk_seconds": 300 },
        "tools": { "ffmpeg": "/opt/ffmpeg/bin/ffmpeg" },
        "timeouts": { "compress_ms": 1000 },
        "max_video_size_mb": 20,
        "allow_private_network_urls": true
    })");

    Config& config = getConfig();
    ASSERT_TRUE(config.loadFromFile(file.string()));
    EXPECT_EQ(config.telegramToken, "123:abc");
    EXPECT_EQ(config.transcription.apiKey, "gsk_test");
    EXPECT_EQ(config.transcription.language, "de");
    EXPECT_EQ(config.transcription.chunkSeconds, 300);
    EXPECT_EQ(config.transcription.model, "whisper-large-v3-turbo");
    EXPECT_EQ(config.tools.ffmpeg, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.tools.ffprobe, "ffprobe");
    EXPECT_EQ(config.timeouts.compressMs, 1000);
    EXPECT_EQ(config.maxVideoSizeMB, 20);
    EXPECT_TRUE(config.allowPrivateNetworkUrls);
}

TEST_F(ConfigTest, MissingOrBrokenFileIsRejected)
{
    Config& config = getConfig();
    EXPECT_FALSE(config.loadFromFile((dir_ / "missing.json").string()));

    const fs::path broken = dir_ / "broken.json";
    Testing::writeFile(broken, "{ not json");
    EXPECT_FALSE(config.loadFromFile(broken.string()));
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults)
{
    setenv("GROQ_API_KEY", "gsk_env", 1);
    setenv("REDDIT_VIDEO_MAX_SIZE_MB", "20", 1);
    setenv("AUDIO_CHUNK_SECONDS", "not-a-number", 1);
    setenv("ALLOW_PRIVATE_NETWORK_URLS", "TRUE", 1);

    Config& config = getConfig();
    EXPECT_TRUE(config.loadFromEnvironment());
    EXPECT_EQ(config.transcription.apiKey, "gsk_env");
    EXPECT_EQ(config.maxVideoSizeMB, 20);
    EXPECT_EQ(config.transcription.chunkSeconds, 600);
    EXPECT_TRUE(config.allowPrivateNetworkUrls);
}

TEST_F(ConfigTest, EnvironmentWithoutCredentialsReportsFalse)
{
    EXPECT_FALSE(getConfig().loadFromEnvironment());
}

TEST_F(ConfigTest, PipelineSettingsFollowConfig)
{
    Config& config = getConfig();
    config.maxVideoSizeMB = 10;
    config.transcription.maxFileMB = 5;
    config.transcription.apiKey = "key";
    config.archiveDir = "/var/tmp/originals";

    PipelineSettings settings = PipelineSettings::fromConfig(config);
    EXPECT_EQ(settings.postProcessor.maxVideoBytes, 10ULL * 1024 * 1024);
    EXPECT_EQ(settings.postProcessor.maxTranscribeBytes, 5ULL * 1024 * 1024);
    EXPECT_EQ(settings.postProcessor.chunkSeconds, 600);
    EXPECT_DOUBLE_EQ(settings.postProcessor.twoPassTargetMB, 49.0);
    EXPECT_EQ(settings.postProcessor.archiveDir, "/var/tmp/originals");
    EXPECT_EQ(settings.downloader.maxVideoSizeMB, 10);
    EXPECT_EQ(settings.downloader.streamTimeoutSec, 120);
    EXPECT_EQ(settings.transcriber.apiKey, "key");
    EXPECT_EQ(settings.manifestTimeoutMs, 15000);
}
