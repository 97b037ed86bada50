#include "media/MediaPipeline.hpp"
#include "media/ManifestParser.hpp"
#include "media/ProxyPool.hpp"
#include "media/SourceResolver.hpp"
#include "models/Config.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include "utils/SubtitleText.hpp"
#include "utils/TempDirectory.hpp"
#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <variant>

namespace fs = std::filesystem;

namespace MediaBot {

namespace {

void report(const ProgressCallback& progress, const std::string& message) {
    if (progress) {
        progress(message);
    }
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return text;
}

bool isAcquisitionError(ErrorKind kind) {
    return kind == ErrorKind::DownloadFailed || kind == ErrorKind::SourceNotFound ||
           kind == ErrorKind::ManifestInvalid || kind == ErrorKind::ProtocolRejected;
}

} // namespace

PipelineSettings PipelineSettings::fromConfig(const Config& config) {
    PipelineSettings settings;

    settings.downloader.curl = config.tools.curl;
    settings.downloader.ytdlp = config.tools.ytdlp;
    settings.downloader.cookiesPath = config.tools.cookiesPath;
    settings.downloader.streamTimeoutSec = static_cast<long>(config.timeouts.streamSec);
    settings.downloader.extractorTimeout = std::chrono::milliseconds(config.timeouts.extractorMs);
    settings.downloader.maxVideoSizeMB = config.maxVideoSizeMB;

    settings.postProcessor.ffmpeg = config.tools.ffmpeg;
    settings.postProcessor.ffprobe = config.tools.ffprobe;
    settings.postProcessor.ffmpegTimeout = std::chrono::milliseconds(config.timeouts.ffmpegMs);
    settings.postProcessor.compressTimeout = std::chrono::milliseconds(config.timeouts.compressMs);
    settings.postProcessor.probeTimeout = std::chrono::milliseconds(config.timeouts.probeMs);
    settings.postProcessor.maxVideoBytes = static_cast<uint64_t>(config.maxVideoSizeMB) * 1024 * 1024;
    settings.postProcessor.twoPassTargetMB = static_cast<double>(config.twoPassTargetMB);
    settings.postProcessor.maxTranscribeBytes = static_cast<uint64_t>(config.transcription.maxFileMB) * 1024 * 1024;
    settings.postProcessor.chunkSeconds = static_cast<int>(config.transcription.chunkSeconds);
    settings.postProcessor.archiveDir = config.archiveDir;

    settings.transcriber.apiKey = config.transcription.apiKey;
    settings.transcriber.endpoint = config.transcription.endpoint;
    settings.transcriber.model = config.transcription.model;
    settings.transcriber.language = config.transcription.language;
    settings.transcriber.timeoutMs = static_cast<long>(config.transcription.timeoutMs);

    settings.tempRoot = config.tempRoot;
    settings.manifestTimeoutMs = static_cast<long>(config.timeouts.manifestMs);
    return settings;
}

MediaPipeline::MediaPipeline(CommandRunner& runner,
                             HttpClient& http,
                             ProxyPool& proxies,
                             VideoSourceResolver& resolver,
                             UrlPredicate isAllowed,
                             PipelineSettings settings)
    : http(http)
    , resolver(resolver)
    , isAllowed(std::move(isAllowed))
    , settings(std::move(settings))
    , downloader(runner, proxies, this->settings.downloader)
    , postProcessor(runner, this->settings.postProcessor)
    , transcriber(http, this->settings.transcriber) {
}

bool MediaPipeline::allowed(const std::string& url) const {
    return !isAllowed || isAllowed(url);
}

fs::path MediaPipeline::workDir(const ExtractResult& result) const {
    return result.tempDir->path();
}

ExtractResult MediaPipeline::run(const MediaRequest& request, const ProgressCallback& progress) {
    ExtractResult result;
    result.url = request.url;
    result.platform = detectPlatform(request.url);
    result.tempDir = TempDirectory::create("mediabot-extract-", settings.tempRoot);

    LOG_PIPE_INFO("Starting {} run for {} ({})", modeToString(request.mode), request.url,
                  platformLabel(result.platform));

    try {
        execute(request, result, progress);
    } catch (const PipelineError& e) {
        LOG_PIPE_ERROR("Run failed [{}]: {}", errorKindToString(e.kind()), e.what());
        result.tempDir->cleanup();
        throw;
    } catch (const std::exception& e) {
        LOG_PIPE_ERROR("Run failed: {}", e.what());
        result.tempDir->cleanup();
        throw;
    }

    LOG_PIPE_INFO("Run finished for {} ({} warnings)", request.url, result.warnings.size());
    return result;
}

void MediaPipeline::execute(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress) {
    if (!UrlUtils::isHttpUrl(request.url)) {
        throw PipelineError(ErrorKind::ProtocolRejected, "Only http(s) URLs are supported");
    }
    if (!allowed(request.url)) {
        throw PipelineError(ErrorKind::ProtocolRejected, "URL blocked for security reasons");
    }

    // Reddit video runs never touch the extractor for metadata
    const bool redditVideoOnly = result.platform == Platform::Reddit && request.mode == ExtractMode::Video;
    if (redditVideoOnly) {
        result.title = "Reddit video";
    } else {
        report(progress, "Fetching metadata...");
        MediaMetadata metadata = downloader.fetchMetadata(request.url, progress);
        result.title = metadata.title;
        result.duration = metadata.duration;
    }

    // In "all" mode every branch is optional; elsewhere the first failure aborts
    const bool optionalBranches = request.mode == ExtractMode::All;
    std::optional<PipelineError> firstError;
    auto degrade = [&](const PipelineError& e, const std::string& warning) {
        if (!optionalBranches || e.kind() == ErrorKind::Cancelled) {
            throw e;
        }
        if (!firstError) {
            firstError = e;
        }
        LOG_PIPE_WARN("{}", warning);
        result.warnings.push_back(warning);
    };

    bool haveCaptions = false;
    if (request.wantsText() && result.platform == Platform::YouTube && request.subtitleFormat) {
        haveCaptions = fetchCaptions(request, result, progress);
    }

    const bool needsTranscript = request.wantsText() && !haveCaptions;
    if (request.wantsAudio() || needsTranscript) {
        std::optional<std::string> audioPath;
        try {
            report(progress, "Downloading audio...");
            audioPath = downloader.downloadAudio(request.url, workDir(result), progress);
        } catch (const PipelineError& e) {
            degrade(e, std::string("Audio download failed: ") + e.what());
        }

        // Audio used only for speech-to-text is not part of the result
        if (audioPath && request.wantsAudio()) {
            result.audioPath = audioPath;
        }

        if (audioPath && needsTranscript) {
            try {
                report(progress, "Transcribing...");
                acquireText(*audioPath, result, progress);
            } catch (const PipelineError& e) {
                degrade(e, std::string("Transcription failed: ") + e.what());
            }
        }
    }

    if (request.wantsVideo()) {
        try {
            report(progress, "Downloading video...");
            result.videoPath = acquireVideo(request, result, progress);
        } catch (const PipelineError& e) {
            if (e.kind() == ErrorKind::Cancelled) {
                throw;
            }

            if (request.mode == ExtractMode::Video && e.kind() == ErrorKind::DownloadFailed) {
                result.warnings.push_back(std::string("Video download failed: ") + e.what());
                LOG_PIPE_WARN("Video download failed, falling back to audio: {}", e.what());
                try {
                    report(progress, "Downloading audio instead...");
                    result.audioPath = downloader.downloadAudio(request.url, workDir(result), progress);
                    result.warnings.push_back("Sending audio instead.");
                } catch (const PipelineError& audioError) {
                    if (audioError.kind() == ErrorKind::Cancelled) {
                        throw;
                    }
                    LOG_PIPE_WARN("Audio fallback failed: {}", audioError.what());
                    throw e;
                }
            } else {
                const std::string prefix = isAcquisitionError(e.kind()) ? "Video download failed: " : "Video unavailable: ";
                degrade(e, prefix + e.what());
            }
        }
    }

    if (!result.duration && result.videoPath) {
        try {
            result.duration = postProcessor.probeDuration(*result.videoPath);
        } catch (const PipelineError& e) {
            if (e.kind() == ErrorKind::Cancelled) {
                throw;
            }
            LOG_PIPE_DEBUG("Duration probe skipped: {}", e.what());
        }
    }

    if (optionalBranches && !result.transcript && !result.subtitlePath && !result.audioPath && !result.videoPath) {
        if (firstError) {
            throw *firstError;
        }
        throw PipelineError(ErrorKind::SourceNotFound, "Nothing could be extracted from " + request.url);
    }
}

bool MediaPipeline::fetchCaptions(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress) {
    const SubtitleFormat format = *request.subtitleFormat;
    report(progress, "Fetching subtitles (" + toUpper(subtitleFormatToString(format)) + ")...");

    auto subsPath = downloader.downloadSubtitles(request.url, workDir(result), format, progress);
    if (subsPath) {
        if (format == SubtitleFormat::Text) {
            std::string text = SubtitleText::fileToPlainText(*subsPath);
            if (!text.empty()) {
                result.transcript = std::move(text);
                return true;
            }
            LOG_PIPE_WARN("Caption file {} contained no text", *subsPath);
        } else {
            result.subtitlePath = *subsPath;
            result.subtitleFormat = format;
            return true;
        }
    }

    result.warnings.push_back("No YouTube subtitles available. Falling back to Whisper transcription.");
    return false;
}

void MediaPipeline::acquireText(const std::string& audioPath, ExtractResult& result, const ProgressCallback& progress) {
    const std::vector<std::string> files = postProcessor.prepareForTranscription(audioPath);
    result.transcript = transcriber.transcribe(files, progress);
}

std::string MediaPipeline::acquireVideo(const MediaRequest& request, ExtractResult& result, const ProgressCallback& progress) {
    std::string candidate;
    if (result.platform == Platform::Reddit) {
        candidate = downloadRedditVideo(request.url, result, progress);
    } else {
        candidate = downloader.downloadVideo(request.url, workDir(result), progress);
    }

    CompressionResult compressed = postProcessor.compressToFit(candidate, workDir(result), progress);
    return compressed.path;
}

std::string MediaPipeline::downloadRedditVideo(const std::string& url, ExtractResult& result, const ProgressCallback& progress) {
    const VideoSource source = resolver.resolve(url);

    if (const auto* dash = std::get_if<DashSource>(&source)) {
        return downloadDashStreams(dash->manifestUrl, result, progress);
    }

    if (const auto* external = std::get_if<ExternalSource>(&source)) {
        const std::string host = UrlUtils::hostOf(external->url);
        report(progress, "Downloading video from " + (host.empty() ? std::string("external site") : host) + "...");
        const fs::path dest = workDir(result) / "video_ytdlp.mp4";
        downloader.downloadExternal(external->url, dest, progress);
        return dest.string();
    }

    throw PipelineError(ErrorKind::SourceNotFound, "No video found in that link");
}

std::string MediaPipeline::downloadDashStreams(const std::string& manifestUrl, ExtractResult& result, const ProgressCallback& progress) {
    auto selection = ManifestParser::fetch(http, manifestUrl, settings.manifestTimeoutMs);
    if (!selection || !selection->videoUrl) {
        throw PipelineError(ErrorKind::ManifestInvalid, "Failed to locate a downloadable video stream");
    }

    const std::string& videoUrl = *selection->videoUrl;
    if (!allowed(videoUrl)) {
        throw PipelineError(ErrorKind::ProtocolRejected, "Video stream URL blocked for security reasons");
    }

    const fs::path dir = workDir(result);
    const fs::path videoPath = dir / ("video" + UrlUtils::extension(videoUrl, ".mp4"));
    downloader.downloadStream(videoUrl, videoPath);

    if (!selection->audioUrl) {
        return videoPath.string();
    }

    const std::string& audioUrl = *selection->audioUrl;
    if (!allowed(audioUrl)) {
        LOG_PIPE_WARN("Audio stream URL blocked, sending video-only");
        result.warnings.push_back("Audio stream blocked, sending video-only.");
        return videoPath.string();
    }

    const fs::path audioPath = dir / ("audio" + UrlUtils::extension(audioUrl, ".mp4"));
    downloader.downloadStream(audioUrl, audioPath);

    const fs::path mergedPath = dir / "video_merged.mp4";
    try {
        report(progress, "Merging video and audio...");
        postProcessor.merge(videoPath.string(), audioPath.string(), mergedPath.string());
        return mergedPath.string();
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Cancelled) {
            throw;
        }
        LOG_PIPE_WARN("Merge failed, sending video-only: {}", e.what());
        result.warnings.push_back("Merge failed, sending video-only.");
        return videoPath.string();
    }
}

} // namespace MediaBot
