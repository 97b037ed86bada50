#include "models/MediaTypes.hpp"
#include "utils/TempDirectory.hpp"
#include <algorithm>
#include <cctype>

namespace MediaBot {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

} // namespace

std::string platformToString(Platform platform) {
    switch (platform) {
        case Platform::YouTube: return "youtube";
        case Platform::Instagram: return "instagram";
        case Platform::TikTok: return "tiktok";
        case Platform::Reddit: return "reddit";
        default: return "unknown";
    }
}

std::string platformLabel(Platform platform) {
    switch (platform) {
        case Platform::YouTube: return "YouTube";
        case Platform::Instagram: return "Instagram";
        case Platform::TikTok: return "TikTok";
        case Platform::Reddit: return "Reddit";
        default: return "Unknown";
    }
}

std::optional<ExtractMode> stringToMode(const std::string& str) {
    const std::string lower = toLower(str);
    if (lower == "text") return ExtractMode::Text;
    if (lower == "audio") return ExtractMode::Audio;
    if (lower == "video") return ExtractMode::Video;
    if (lower == "all") return ExtractMode::All;
    return std::nullopt;
}

std::string modeToString(ExtractMode mode) {
    switch (mode) {
        case ExtractMode::Text: return "text";
        case ExtractMode::Audio: return "audio";
        case ExtractMode::Video: return "video";
        default: return "all";
    }
}

std::optional<SubtitleFormat> stringToSubtitleFormat(const std::string& str) {
    const std::string lower = toLower(str);
    if (lower == "text" || lower == "txt") return SubtitleFormat::Text;
    if (lower == "srt") return SubtitleFormat::Srt;
    if (lower == "vtt") return SubtitleFormat::Vtt;
    return std::nullopt;
}

std::string subtitleFormatToString(SubtitleFormat format) {
    switch (format) {
        case SubtitleFormat::Srt: return "srt";
        case SubtitleFormat::Vtt: return "vtt";
        default: return "text";
    }
}

void cleanupExtractResult(ExtractResult& result) {
    if (result.tempDir) {
        result.tempDir->cleanup();
    }
}

} // namespace MediaBot
