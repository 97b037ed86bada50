#include "media/MediaDownloader.hpp"
#include "media/ProxyPool.hpp"
#include "models/PipelineError.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace fs = std::filesystem;

namespace MediaBot {

namespace {

// Plain phrases; "ip ... block" is checked per line separately
const std::vector<std::string>& blockPhrases() {
    static const std::vector<std::string> phrases = {
        "not comfortable for some audiences",
        "log in for access",
        "blocked from accessing",
        "access denied",
        "403",
    };
    return phrases;
}

constexpr std::chrono::milliseconds kMetadataTimeout{30000};
constexpr std::chrono::milliseconds kSubtitleTimeout{60000};
constexpr std::chrono::milliseconds kExternalTimeout{120000};

void throwIfCancelled(const CommandResult& result) {
    if (result.cancelled) {
        throw PipelineError(ErrorKind::Cancelled, result.error);
    }
}

} // namespace

MediaDownloader::MediaDownloader(CommandRunner& runner, ProxyPool& proxies, DownloaderOptions options)
    : runner(runner)
    , proxies(proxies)
    , options(std::move(options)) {
}

bool MediaDownloader::isBlockSignature(const std::string& message) {
    const std::string lowered = UrlUtils::toLower(message);
    for (const auto& phrase : blockPhrases()) {
        if (lowered.find(phrase) != std::string::npos) {
            return true;
        }
    }

    std::istringstream lines(lowered);
    std::string line;
    while (std::getline(lines, line)) {
        const size_t ip = line.find("ip");
        if (ip != std::string::npos && line.find("block", ip + 3) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> MediaDownloader::cookieArgs() const {
    if (options.cookiesPath.empty()) {
        return {};
    }
    std::error_code ec;
    if (!fs::exists(options.cookiesPath, ec)) {
        return {};
    }
    return {"--cookies", options.cookiesPath};
}

CommandResult MediaDownloader::runExtractor(const std::vector<std::string>& args,
                                            const std::string& url,
                                            std::chrono::milliseconds timeout,
                                            const ProgressCallback& progress,
                                            bool separateUrl) {
    CommandSpec spec;
    spec.program = options.ytdlp;
    spec.args = args;
    for (auto& arg : cookieArgs()) {
        spec.args.push_back(arg);
    }
    spec.timeout = timeout;

    auto withUrl = [&](CommandSpec command) {
        if (separateUrl) {
            command.args.push_back("--");
        }
        command.args.push_back(url);
        return command;
    };

    CommandResult result = runner.run(withUrl(spec));
    if (result.success) {
        return result;
    }
    throwIfCancelled(result);

    if (!isBlockSignature(result.error)) {
        return result;
    }

    auto proxy = proxies.next();
    if (!proxy) {
        return result;
    }

    LOG_DL_INFO("Retrying with proxy after: {}", truncateText(result.error, 100));
    if (progress) {
        progress("Retrying with proxy...");
    }

    CommandSpec retry = spec;
    retry.args.push_back("--proxy");
    retry.args.push_back(*proxy);

    CommandResult retried = runner.run(withUrl(retry));
    if (retried.success) {
        return retried;
    }
    throwIfCancelled(retried);

    // The first failure is the one worth reporting
    LOG_DL_WARN("Proxy retry failed: {}", truncateText(retried.error, 200));
    return result;
}

uint64_t MediaDownloader::downloadStream(const std::string& url, const fs::path& dest) {
    CommandSpec spec;
    spec.program = options.curl;
    spec.args = {
        "-sS", "-f", "-L",
        "--connect-timeout", "10",
        "--max-time", std::to_string(options.streamTimeoutSec),
        "--retry", "2",
        "--retry-delay", "2",
        "-o", dest.string(),
        url
    };
    spec.timeout = std::chrono::seconds(options.streamTimeoutSec + 10);

    LOG_DL_INFO("Downloading stream {}", url);
    CommandResult result = runner.run(spec);
    throwIfCancelled(result);
    if (!result.success) {
        throw PipelineError(ErrorKind::DownloadFailed,
                            "Failed to download stream: " + truncateText(result.error));
    }

    std::error_code ec;
    const auto size = fs::file_size(dest, ec);
    if (ec || size == 0) {
        throw PipelineError(ErrorKind::DownloadFailed,
                            "Downloaded stream is missing or empty: " + dest.filename().string());
    }

    LOG_DL_INFO("Stream downloaded: {:.1f}MB", static_cast<double>(size) / (1024.0 * 1024.0));
    return size;
}

MediaMetadata MediaDownloader::fetchMetadata(const std::string& url, const ProgressCallback& progress) {
    MediaMetadata metadata;

    CommandResult result = runExtractor({
        "--no-download",
        "--print", "%(title)s\n%(duration)s",
        "--no-playlist",
        "--socket-timeout", "15"
    }, url, kMetadataTimeout, progress);

    if (!result.success) {
        LOG_DL_WARN("Metadata lookup failed: {}", truncateText(result.error, 200));
        return metadata;
    }

    std::istringstream stream(UrlUtils::trim(result.output));
    std::string titleLine;
    std::string durationLine;
    std::getline(stream, titleLine);
    std::getline(stream, durationLine);

    titleLine = UrlUtils::trim(titleLine);
    if (!titleLine.empty()) {
        metadata.title = titleLine;
    }

    durationLine = UrlUtils::trim(durationLine);
    if (!durationLine.empty()) {
        char* end = nullptr;
        const double value = std::strtod(durationLine.c_str(), &end);
        if (end != durationLine.c_str() && value > 0) {
            metadata.duration = value;
        }
    }

    return metadata;
}

std::string MediaDownloader::downloadAudio(const std::string& url,
                                           const fs::path& outputDir,
                                           const ProgressCallback& progress) {
    const std::string outputTemplate = (outputDir / "audio.%(ext)s").string();

    CommandResult result = runExtractor({
        "-x",
        "--audio-format", "mp3",
        "--audio-quality", "0",
        "-o", outputTemplate,
        "--no-playlist",
        "--socket-timeout", "30",
        "--retries", "3",
        "--no-warnings"
    }, url, options.extractorTimeout, progress);

    if (!result.success) {
        throw PipelineError(ErrorKind::DownloadFailed, truncateText(result.error));
    }

    auto path = findOutput(outputDir, "audio.");
    if (!path) {
        throw PipelineError(ErrorKind::DownloadFailed, "yt-dlp produced no audio output");
    }
    LOG_DL_INFO("Audio downloaded: {}", *path);
    return *path;
}

std::string MediaDownloader::downloadVideo(const std::string& url,
                                           const fs::path& outputDir,
                                           const ProgressCallback& progress) {
    const std::string outputTemplate = (outputDir / "video.%(ext)s").string();

    CommandResult result = runExtractor({
        "-f", "best[ext=mp4]/best",
        "--merge-output-format", "mp4",
        "-o", outputTemplate,
        "--no-playlist",
        "--socket-timeout", "30",
        "--retries", "3",
        "--no-warnings",
        "--max-filesize", std::to_string(options.maxVideoSizeMB) + "M"
    }, url, options.extractorTimeout, progress);

    if (!result.success) {
        throw PipelineError(ErrorKind::DownloadFailed, truncateText(result.error));
    }

    auto path = findOutput(outputDir, "video.");
    if (!path) {
        throw PipelineError(ErrorKind::DownloadFailed, "yt-dlp produced no video output");
    }
    LOG_DL_INFO("Video downloaded: {}", *path);
    return *path;
}

std::optional<std::string> MediaDownloader::downloadSubtitles(const std::string& url,
                                                              const fs::path& outputDir,
                                                              SubtitleFormat format,
                                                              const ProgressCallback& progress) {
    const std::string outputTemplate = (outputDir / "subs.%(ext)s").string();
    // Plain text is derived from VTT
    const std::string subFormat = format == SubtitleFormat::Text ? "vtt" : subtitleFormatToString(format);

    CommandResult result = runExtractor({
        "--no-download",
        "--write-auto-subs",
        "--write-subs",
        "--sub-langs", "en.*,en",
        "--sub-format", subFormat,
        "--convert-subs", subFormat,
        "-o", outputTemplate,
        "--no-playlist",
        "--socket-timeout", "15"
    }, url, kSubtitleTimeout, progress);

    if (!result.success) {
        LOG_DL_INFO("No captions available: {}", truncateText(result.error, 200));
        return std::nullopt;
    }

    return findOutput(outputDir, "subs.", {".srt", ".vtt"});
}

uint64_t MediaDownloader::downloadExternal(const std::string& url,
                                           const fs::path& dest,
                                           const ProgressCallback& progress) {
    LOG_DL_INFO("Downloading external video via yt-dlp: {}", url);

    CommandResult result = runExtractor({
        "-f", "best[ext=mp4]/best",
        "--merge-output-format", "mp4",
        "-o", dest.string(),
        "--no-playlist",
        "--socket-timeout", "30"
    }, url, kExternalTimeout, progress, true);

    if (!result.success) {
        throw PipelineError(ErrorKind::DownloadFailed, truncateText(result.error));
    }

    std::error_code ec;
    const auto size = fs::file_size(dest, ec);
    if (ec) {
        throw PipelineError(ErrorKind::DownloadFailed, "yt-dlp produced no output at " + dest.string());
    }
    return size;
}

std::optional<std::string> MediaDownloader::findOutput(const fs::path& dir,
                                                       const std::string& prefix,
                                                       const std::vector<std::string>& extensions) {
    std::vector<std::string> matches;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0) {
            continue;
        }
        if (!extensions.empty()) {
            const std::string ext = it->path().extension().string();
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
                continue;
            }
        }
        // yt-dlp leaves .part files behind on interrupted downloads
        if (it->path().extension() == ".part") {
            continue;
        }
        matches.push_back(it->path().string());
    }

    if (matches.empty()) {
        return std::nullopt;
    }
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

} // namespace MediaBot
