#pragma once

#include <string>

namespace MediaBot {

/**
 * Caption file to plain text conversion
 */
class SubtitleText {
public:
    /**
     * Convert WebVTT or SRT content to plain text.
     * Drops headers, cue numbers, timestamps and inline tags; collapses
     * consecutive duplicate lines produced by auto-generated captions.
     */
    static std::string toPlainText(const std::string& content);

    // Read a caption file and convert it; empty string when unreadable
    static std::string fileToPlainText(const std::string& path);
};

} // namespace MediaBot
