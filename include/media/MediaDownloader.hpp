#pragma once

#include "models/MediaTypes.hpp"
#include "utils/ProcessRunner.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace MediaBot {

class ProxyPool;

/**
 * Tool locations and limits for the downloader
 */
struct DownloaderOptions {
    std::string curl = "curl";
    std::string ytdlp = "yt-dlp";
    std::string cookiesPath;
    long streamTimeoutSec = 120;
    std::chrono::milliseconds extractorTimeout{180000};
    int64_t maxVideoSizeMB = 50;
};

/**
 * Title and duration reported by the extractor
 */
struct MediaMetadata {
    std::string title = "Untitled";
    std::optional<double> duration;
};

/**
 * Subprocess-based downloads: direct streams through curl, everything
 * else through yt-dlp with a one-shot proxy retry on block signatures.
 * Failures throw PipelineError (DownloadFailed or Cancelled).
 */
class MediaDownloader {
public:
    MediaDownloader(CommandRunner& runner, ProxyPool& proxies, DownloaderOptions options);

    // Fetch a direct media URL to dest, returns the file size
    uint64_t downloadStream(const std::string& url, const std::filesystem::path& dest);

    // Never fails; falls back to "Untitled" and no duration
    MediaMetadata fetchMetadata(const std::string& url, const ProgressCallback& progress = nullptr);

    // Extract audio as mp3 into outputDir, returns the file path
    std::string downloadAudio(const std::string& url,
                              const std::filesystem::path& outputDir,
                              const ProgressCallback& progress = nullptr);

    // Download best mp4 into outputDir, clamped to the size ceiling
    std::string downloadVideo(const std::string& url,
                              const std::filesystem::path& outputDir,
                              const ProgressCallback& progress = nullptr);

    // Native captions; nullopt when none are available
    std::optional<std::string> downloadSubtitles(const std::string& url,
                                                 const std::filesystem::path& outputDir,
                                                 SubtitleFormat format,
                                                 const ProgressCallback& progress = nullptr);

    // Embedded video from a third-party host, no size clamp
    uint64_t downloadExternal(const std::string& url,
                              const std::filesystem::path& dest,
                              const ProgressCallback& progress = nullptr);

    // True when extractor output looks like an IP block or login wall
    static bool isBlockSignature(const std::string& message);

    const DownloaderOptions& getOptions() const { return options; }

private:
    CommandRunner& runner;
    ProxyPool& proxies;
    DownloaderOptions options;

    CommandResult runExtractor(const std::vector<std::string>& args,
                               const std::string& url,
                               std::chrono::milliseconds timeout,
                               const ProgressCallback& progress,
                               bool separateUrl = false);

    std::vector<std::string> cookieArgs() const;

    static std::optional<std::string> findOutput(const std::filesystem::path& dir,
                                                 const std::string& prefix,
                                                 const std::vector<std::string>& extensions = {});
};

} // namespace MediaBot
