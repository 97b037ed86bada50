#pragma once

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <functional>

namespace MediaBot {

class TempDirectory;

/**
 * Source platform family, detected from the URL host
 */
enum class Platform {
    YouTube,
    Instagram,
    TikTok,
    Reddit,
    Unknown
};

/**
 * What the caller wants back from a run
 */
enum class ExtractMode {
    Text,
    Audio,
    Video,
    All
};

/**
 * Requested caption delivery format
 */
enum class SubtitleFormat {
    Text,   // plain transcript
    Srt,
    Vtt
};

std::string platformToString(Platform platform);
std::string platformLabel(Platform platform);

std::optional<ExtractMode> stringToMode(const std::string& str);
std::string modeToString(ExtractMode mode);

std::optional<SubtitleFormat> stringToSubtitleFormat(const std::string& str);
std::string subtitleFormatToString(SubtitleFormat format);

/**
 * Progress callback, invoked with short status strings
 */
using ProgressCallback = std::function<void(const std::string&)>;

/**
 * Boolean allow-list predicate applied to every URL before it is fetched
 */
using UrlPredicate = std::function<bool(const std::string&)>;

/**
 * One pipeline request
 */
struct MediaRequest {
    std::string url;
    ExtractMode mode = ExtractMode::Text;
    std::optional<SubtitleFormat> subtitleFormat;

    bool wantsText() const { return mode == ExtractMode::Text || mode == ExtractMode::All; }
    bool wantsAudio() const { return mode == ExtractMode::Audio || mode == ExtractMode::All; }
    bool wantsVideo() const { return mode == ExtractMode::Video || mode == ExtractMode::All; }
};

/**
 * Resolved fetch target
 */
struct DashSource {
    std::string manifestUrl;
};

struct ExternalSource {
    std::string url;
};

struct NoSource {};

using VideoSource = std::variant<NoSource, DashSource, ExternalSource>;

/**
 * Best representations found in a manifest
 */
struct ManifestSelection {
    std::optional<std::string> videoUrl;
    std::optional<std::string> audioUrl;
};

/**
 * Artifact bundle produced by a run.
 * All paths live under tempDir until cleanupExtractResult() is called.
 */
struct ExtractResult {
    Platform platform = Platform::Unknown;
    std::string title = "Untitled";
    std::string url;
    std::optional<double> duration;            // seconds
    std::optional<std::string> transcript;
    std::optional<std::string> subtitlePath;
    std::optional<SubtitleFormat> subtitleFormat;
    std::optional<std::string> audioPath;
    std::optional<std::string> videoPath;
    std::vector<std::string> warnings;
    std::shared_ptr<TempDirectory> tempDir;
};

/**
 * Remove the run's temp directory. Safe to call more than once.
 */
void cleanupExtractResult(ExtractResult& result);

} // namespace MediaBot
