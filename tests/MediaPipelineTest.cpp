#include <gtest/gtest.h>
#include "FakeTools.hpp"
#include "media/MediaPipeline.hpp"
#include "media/ProxyPool.hpp"
#include "media/SourceResolver.hpp"
#include "utils/TempDirectory.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace MediaBot;
using Testing::FakeCommandRunner;
using Testing::FakeHttpClient;

namespace {

using Script = std::function<CommandResult(const CommandSpec&)>;

const std::string kYouTubeUrl = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
const std::string kRedditUrl = "https://www.reddit.com/r/videos/comments/abc123/some_title/";
const std::string kManifestUrl = "https://v.redd.it/xyz789/DASHPlaylist.mpd";

const char* kManifest = R"(<?xml version="1.0"?>
<MPD><Period>
  <AdaptationSet contentType="video">
    <Representation id="v1" bandwidth="800000"><BaseURL>DASH_480.mp4</BaseURL></Representation>
    <Representation id="v2" bandwidth="2400000"><BaseURL>DASH_720.mp4</BaseURL></Representation>
  </AdaptationSet>
  <AdaptationSet contentType="audio">
    <Representation id="a1" bandwidth="128000"><BaseURL>DASH_AUDIO_128.mp4</BaseURL></Representation>
  </AdaptationSet>
</Period></MPD>)";

// Write the file yt-dlp would produce for its -o template
void writeTemplateOutput(const CommandSpec& spec, const std::string& ext, std::uintmax_t size)
{
    std::string path = *Testing::argAfter(spec, "-o");
    const std::string token = "%(ext)s";
    const auto pos = path.find(token);
    if (pos != std::string::npos) {
        path.replace(pos, token.size(), ext);
    }
    Testing::makeFileOfSize(path, size);
}

class FakeResolver : public VideoSourceResolver {
public:
    VideoSource source;
    std::vector<std::string> inputs;

    VideoSource resolve(const std::string& input) override
    {
        inputs.push_back(input);
        return source;
    }
};

} // namespace

class MediaPipelineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{0};
        workDir_ = fs::temp_directory_path() /
            ("mediabot_pipeline_test_" + std::to_string(++counter) + "_" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(workDir_);

        settings_.tempRoot = workDir_.string();
        settings_.transcriber.apiKey = "gsk_test";

        onMetadata = [](const CommandSpec&) { return FakeCommandRunner::ok("Never Gonna Give You Up\n212\n"); };
        onSubtitles = [](const CommandSpec& spec) {
            return FakeCommandRunner::fail(spec.program, "There are no subtitles for the requested languages");
        };
        onAudio = [](const CommandSpec& spec) {
            writeTemplateOutput(spec, "mp3", 1024);
            return FakeCommandRunner::ok();
        };
        onVideo = [](const CommandSpec& spec) {
            writeTemplateOutput(spec, "mp4", 4096);
            return FakeCommandRunner::ok();
        };
        onExternal = [](const CommandSpec& spec) {
            writeTemplateOutput(spec, "mp4", 4096);
            return FakeCommandRunner::ok();
        };

        runner_.setHandler([this](const CommandSpec& spec) { return dispatch(spec); });
        http_.onGet = [](const std::string&) { return FakeHttpClient::respond(200, kManifest); };
        http_.onPost = [](const Testing::RecordedPost&) {
            return FakeHttpClient::respond(200, R"({"text": "whisper transcript"})");
        };
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(workDir_, ec);
    }

    CommandResult dispatch(const CommandSpec& spec)
    {
        if (spec.program == "yt-dlp") {
            if (Testing::hasArg(spec, "--print")) {
                return onMetadata(spec);
            }
            if (Testing::hasArg(spec, "--write-subs")) {
                return onSubtitles(spec);
            }
            if (Testing::hasArg(spec, "-x")) {
                return onAudio(spec);
            }
            if (Testing::hasArg(spec, "--max-filesize")) {
                return onVideo(spec);
            }
            if (Testing::hasArg(spec, "--")) {
                return onExternal(spec);
            }
        }
        if (spec.program == "curl") {
            Testing::makeFileOfSize(*Testing::argAfter(spec, "-o"), 2048);
            return FakeCommandRunner::ok();
        }
        if (spec.program == "ffmpeg") {
            Testing::makeFileOfSize(spec.args.back(), 3072);
            return FakeCommandRunner::ok();
        }
        if (spec.program == "ffprobe") {
            return FakeCommandRunner::ok("30.0\n");
        }
        return FakeCommandRunner::fail(spec.program, "unexpected command");
    }

    ExtractResult run(const std::string& url, ExtractMode mode,
                      std::optional<SubtitleFormat> subs = std::nullopt)
    {
        MediaPipeline pipeline(runner_, http_, proxies_, resolver_, predicate_, settings_);
        MediaRequest request;
        request.url = url;
        request.mode = mode;
        request.subtitleFormat = subs;
        return pipeline.run(request, [this](const std::string& message) { progress_.push_back(message); });
    }

    size_t countExtractorCalls(const std::string& marker) const
    {
        return static_cast<size_t>(std::count_if(runner_.calls().begin(), runner_.calls().end(),
            [&marker](const CommandSpec& spec) { return spec.program == "yt-dlp" && Testing::hasArg(spec, marker); }));
    }

    bool tempRootIsEmpty() const
    {
        return fs::is_empty(workDir_);
    }

    bool hasWarning(const ExtractResult& result, const std::string& text) const
    {
        return std::find(result.warnings.begin(), result.warnings.end(), text) != result.warnings.end();
    }

    bool sawProgress(const std::string& text) const
    {
        return std::find(progress_.begin(), progress_.end(), text) != progress_.end();
    }

    Script onMetadata;
    Script onSubtitles;
    Script onAudio;
    Script onVideo;
    Script onExternal;

    fs::path workDir_;
    PipelineSettings settings_;
    FakeCommandRunner runner_;
    FakeHttpClient http_;
    ProxyPool proxies_;
    FakeResolver resolver_;
    UrlPredicate predicate_ = [](const std::string&) { return true; };
    std::vector<std::string> progress_;
};

TEST_F(MediaPipelineTest, YouTubeCaptionsSkipTranscription)
{
    onSubtitles = [](const CommandSpec& spec) {
        fs::path dir = fs::path(*Testing::argAfter(spec, "-o")).parent_path();
        Testing::writeFile(dir / "subs.en.vtt",
            "WEBVTT\nKind: captions\nLanguage: en\n\n"
            "00:00:00.000 --> 00:00:02.000\nWe're no strangers to love\n\n"
            "00:00:02.000 --> 00:00:04.000\n<c>You know the rules</c>\n");
        return FakeCommandRunner::ok();
    };

    ExtractResult result = run(kYouTubeUrl, ExtractMode::Text, SubtitleFormat::Text);

    EXPECT_EQ(result.platform, Platform::YouTube);
    EXPECT_EQ(result.title, "Never Gonna Give You Up");
    ASSERT_TRUE(result.duration.has_value());
    EXPECT_DOUBLE_EQ(*result.duration, 212.0);
    ASSERT_TRUE(result.transcript.has_value());
    EXPECT_EQ(*result.transcript, "We're no strangers to love\nYou know the rules");
    EXPECT_FALSE(result.audioPath.has_value());
    EXPECT_FALSE(result.videoPath.has_value());
    EXPECT_TRUE(result.warnings.empty());

    EXPECT_EQ(countExtractorCalls("-x"), 0u);
    EXPECT_TRUE(http_.posts.empty());
    EXPECT_TRUE(sawProgress("Fetching subtitles (TEXT)..."));

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, MissingCaptionsFallBackToWhisper)
{
    ExtractResult result = run(kYouTubeUrl, ExtractMode::Text, SubtitleFormat::Text);

    ASSERT_TRUE(result.transcript.has_value());
    EXPECT_EQ(*result.transcript, "whisper transcript");
    // Audio fetched only for transcription is not returned
    EXPECT_FALSE(result.audioPath.has_value());
    EXPECT_TRUE(hasWarning(result, "No YouTube subtitles available. Falling back to Whisper transcription."));

    ASSERT_EQ(http_.posts.size(), 1u);
    EXPECT_EQ(fs::path(http_.posts[0].filePath).filename().string(), "audio.mp3");
    EXPECT_TRUE(sawProgress("Transcribing..."));

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, SrtCaptionsAreReturnedAsFile)
{
    onSubtitles = [](const CommandSpec& spec) {
        fs::path dir = fs::path(*Testing::argAfter(spec, "-o")).parent_path();
        Testing::writeFile(dir / "subs.en.srt", "1\n00:00:00,000 --> 00:00:02,000\nHello\n");
        return FakeCommandRunner::ok();
    };

    ExtractResult result = run(kYouTubeUrl, ExtractMode::Text, SubtitleFormat::Srt);

    ASSERT_TRUE(result.subtitlePath.has_value());
    EXPECT_EQ(fs::path(*result.subtitlePath).filename().string(), "subs.en.srt");
    EXPECT_EQ(result.subtitleFormat, SubtitleFormat::Srt);
    EXPECT_FALSE(result.transcript.has_value());
    EXPECT_TRUE(http_.posts.empty());

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, AudioModeReturnsAudioOnly)
{
    ExtractResult result = run("https://www.instagram.com/reel/Cabc/", ExtractMode::Audio);

    ASSERT_TRUE(result.audioPath.has_value());
    EXPECT_TRUE(fs::exists(*result.audioPath));
    EXPECT_FALSE(result.transcript.has_value());
    EXPECT_FALSE(result.videoPath.has_value());
    EXPECT_TRUE(http_.posts.empty());
    EXPECT_EQ(countExtractorCalls("--write-subs"), 0u);

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, FailureRemovesTempDirectory)
{
    onAudio = [](const CommandSpec& spec) {
        return FakeCommandRunner::fail(spec.program, "ERROR: Video unavailable");
    };

    try {
        run(kYouTubeUrl, ExtractMode::Text);
        FAIL() << "Expected DownloadFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
    }
    EXPECT_TRUE(tempRootIsEmpty());
}

TEST_F(MediaPipelineTest, RejectsNonHttpAndBlockedUrls)
{
    EXPECT_THROW(run("file:///etc/passwd", ExtractMode::Text), PipelineError);

    predicate_ = [](const std::string&) { return false; };
    try {
        run(kYouTubeUrl, ExtractMode::Video);
        FAIL() << "Expected ProtocolRejected";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolRejected);
    }
    EXPECT_TRUE(runner_.calls().empty());
    EXPECT_TRUE(tempRootIsEmpty());
}

TEST_F(MediaPipelineTest, VideoFailureFallsBackToAudio)
{
    onVideo = [](const CommandSpec& spec) {
        return FakeCommandRunner::fail(spec.program, "ERROR: Requested format is not available");
    };

    ExtractResult result = run("https://www.tiktok.com/@user/video/123", ExtractMode::Video);

    EXPECT_FALSE(result.videoPath.has_value());
    ASSERT_TRUE(result.audioPath.has_value());
    ASSERT_EQ(result.warnings.size(), 2u);
    EXPECT_EQ(result.warnings[0].rfind("Video download failed: ", 0), 0u);
    EXPECT_EQ(result.warnings[1], "Sending audio instead.");

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, VideoAndAudioFailureKeepsVideoError)
{
    onVideo = [](const CommandSpec& spec) {
        return FakeCommandRunner::fail(spec.program, "ERROR: Requested format is not available");
    };
    onAudio = [](const CommandSpec& spec) {
        return FakeCommandRunner::fail(spec.program, "ERROR: audio gone");
    };

    try {
        run("https://www.tiktok.com/@user/video/123", ExtractMode::Video);
        FAIL() << "Expected DownloadFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
        EXPECT_NE(std::string(e.what()).find("Requested format"), std::string::npos);
    }
    EXPECT_TRUE(tempRootIsEmpty());
}

TEST_F(MediaPipelineTest, AllModeDegradesFailedTranscription)
{
    http_.onPost = [](const Testing::RecordedPost&) {
        return FakeHttpClient::respond(500, "upstream error");
    };

    ExtractResult result = run(kYouTubeUrl, ExtractMode::All);

    EXPECT_FALSE(result.transcript.has_value());
    ASSERT_TRUE(result.audioPath.has_value());
    ASSERT_TRUE(result.videoPath.has_value());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("Transcription failed: ", 0), 0u);
    // Metadata already supplied the duration
    EXPECT_EQ(runner_.countCalls("ffprobe"), 0u);

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, AllModeWithNothingExtractedFails)
{
    auto failing = [](const CommandSpec& spec) {
        return FakeCommandRunner::fail(spec.program, "ERROR: Unsupported URL");
    };
    onAudio = failing;
    onVideo = failing;

    try {
        run("https://www.instagram.com/p/xyz/", ExtractMode::All);
        FAIL() << "Expected DownloadFailed";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
    }
    EXPECT_TRUE(tempRootIsEmpty());
}

TEST_F(MediaPipelineTest, RedditDashStreamsAreMerged)
{
    resolver_.source = DashSource{kManifestUrl};

    ExtractResult result = run(kRedditUrl, ExtractMode::Video);

    EXPECT_EQ(result.platform, Platform::Reddit);
    EXPECT_EQ(result.title, "Reddit video");
    ASSERT_TRUE(result.videoPath.has_value());
    EXPECT_EQ(*result.videoPath, (result.tempDir->path() / "video_merged.mp4").string());
    ASSERT_TRUE(result.duration.has_value());
    EXPECT_DOUBLE_EQ(*result.duration, 30.0);
    EXPECT_TRUE(result.warnings.empty());

    EXPECT_EQ(runner_.countCalls("yt-dlp"), 0u);
    ASSERT_EQ(runner_.countCalls("curl"), 2u);
    EXPECT_EQ(runner_.calls()[0].args.back(), "https://v.redd.it/xyz789/DASH_720.mp4");
    EXPECT_EQ(runner_.calls()[1].args.back(), "https://v.redd.it/xyz789/DASH_AUDIO_128.mp4");
    ASSERT_EQ(resolver_.inputs.size(), 1u);
    EXPECT_EQ(resolver_.inputs[0], kRedditUrl);
    ASSERT_EQ(http_.gets.size(), 1u);
    EXPECT_EQ(http_.gets[0], kManifestUrl);
    EXPECT_TRUE(sawProgress("Merging video and audio..."));

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, RedditMergeFailureSendsVideoOnly)
{
    resolver_.source = DashSource{kManifestUrl};
    runner_.setHandler([this](const CommandSpec& spec) {
        if (spec.program == "ffmpeg") {
            return FakeCommandRunner::fail(spec.program, "Invalid data found when processing input");
        }
        return dispatch(spec);
    });

    ExtractResult result = run(kRedditUrl, ExtractMode::Video);

    ASSERT_TRUE(result.videoPath.has_value());
    EXPECT_EQ(fs::path(*result.videoPath).filename().string(), "video.mp4");
    EXPECT_TRUE(hasWarning(result, "Merge failed, sending video-only."));

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, RedditBlockedAudioStreamSendsVideoOnly)
{
    resolver_.source = DashSource{kManifestUrl};
    predicate_ = [](const std::string& url) { return url.find("DASH_AUDIO") == std::string::npos; };

    ExtractResult result = run(kRedditUrl, ExtractMode::Video);

    ASSERT_TRUE(result.videoPath.has_value());
    EXPECT_EQ(fs::path(*result.videoPath).filename().string(), "video.mp4");
    EXPECT_TRUE(hasWarning(result, "Audio stream blocked, sending video-only."));
    EXPECT_EQ(runner_.countCalls("curl"), 1u);
    EXPECT_EQ(runner_.countCalls("ffmpeg"), 0u);

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, RedditBlockedVideoStreamIsRejected)
{
    resolver_.source = DashSource{kManifestUrl};
    predicate_ = [](const std::string& url) { return url.find("DASH_720") == std::string::npos; };

    try {
        run(kRedditUrl, ExtractMode::Video);
        FAIL() << "Expected ProtocolRejected";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProtocolRejected);
    }
    EXPECT_EQ(runner_.countCalls("curl"), 0u);
}

TEST_F(MediaPipelineTest, RedditInvalidManifest)
{
    resolver_.source = DashSource{kManifestUrl};
    http_.onGet = [](const std::string&) { return FakeHttpClient::respond(200, "<html>not a manifest</html>"); };

    try {
        run(kRedditUrl, ExtractMode::Video);
        FAIL() << "Expected ManifestInvalid";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ManifestInvalid);
    }
}

TEST_F(MediaPipelineTest, RedditWithoutVideo)
{
    resolver_.source = NoSource{};

    try {
        run(kRedditUrl, ExtractMode::Video);
        FAIL() << "Expected SourceNotFound";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SourceNotFound);
        EXPECT_STREQ(e.what(), "No video found in that link");
    }
    EXPECT_TRUE(tempRootIsEmpty());
}

TEST_F(MediaPipelineTest, RedditExternalEmbedUsesExtractor)
{
    resolver_.source = ExternalSource{"https://www.redgifs.com/watch/somegif"};

    ExtractResult result = run(kRedditUrl, ExtractMode::Video);

    ASSERT_TRUE(result.videoPath.has_value());
    EXPECT_EQ(fs::path(*result.videoPath).filename().string(), "video_ytdlp.mp4");
    EXPECT_EQ(countExtractorCalls("--"), 1u);
    EXPECT_TRUE(sawProgress("Downloading video from www.redgifs.com..."));

    cleanupExtractResult(result);
}

TEST_F(MediaPipelineTest, CleanupIsIdempotent)
{
    ExtractResult result = run("https://www.instagram.com/reel/Cabc/", ExtractMode::Audio);
    const fs::path dir = result.tempDir->path();
    ASSERT_TRUE(fs::exists(dir));

    cleanupExtractResult(result);
    cleanupExtractResult(result);
    EXPECT_FALSE(fs::exists(dir));
}
