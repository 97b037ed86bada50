#pragma once

#include "media/MediaDownloader.hpp"
#include "media/PostProcessor.hpp"
#include "media/Transcriber.hpp"
#include "models/MediaTypes.hpp"
#include "models/PipelineError.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace MediaBot {

class Config;
class HttpClient;
class ProxyPool;
class VideoSourceResolver;

/**
 * Everything a run needs from configuration, as plain values
 */
struct PipelineSettings {
    DownloaderOptions downloader;
    PostProcessorOptions postProcessor;
    TranscriberOptions transcriber;
    std::string tempRoot;
    long manifestTimeoutMs = 15000;

    static PipelineSettings fromConfig(const Config& config);
};

/**
 * One request in, one artifact bundle out.
 *
 * On success the caller owns the returned temp directory and must call
 * cleanupExtractResult() when done with the files. On failure the temp
 * directory is removed before the error propagates.
 */
class MediaPipeline {
public:
    MediaPipeline(CommandRunner& runner,
                  HttpClient& http,
                  ProxyPool& proxies,
                  VideoSourceResolver& resolver,
                  UrlPredicate isAllowed,
                  PipelineSettings settings);

    ExtractResult run(const MediaRequest& request, const ProgressCallback& progress = nullptr);

private:
    HttpClient& http;
    VideoSourceResolver& resolver;
    UrlPredicate isAllowed;
    PipelineSettings settings;

    MediaDownloader downloader;
    PostProcessor postProcessor;
    Transcriber transcriber;

    void execute(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress);

    // Returns false when captions were unavailable
    bool fetchCaptions(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress);

    void acquireText(const std::string& audioPath, ExtractResult& result, const ProgressCallback& progress);

    std::string acquireVideo(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress);
    std::string downloadRedditVideo(const std::string& url, ExtractResult& result, const ProgressCallback& progress);
    std::string downloadDashStreams(const std::string& manifestUrl, ExtractResult& result, const ProgressCallback& progress);

    bool allowed(const std::string& url) const;
    std::filesystem::path workDir(const ExtractResult& result) const;
};

} // namespace MediaBot
