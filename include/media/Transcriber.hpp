#pragma once

#include "models/MediaTypes.hpp"
#include <string>
#include <vector>

namespace MediaBot {

class HttpClient;

/**
 * Speech-to-text provider settings (OpenAI-compatible endpoint)
 */
struct TranscriberOptions {
    std::string apiKey;
    std::string endpoint = "https://api.groq.com/openai/v1/audio/transcriptions";
    std::string model = "whisper-large-v3-turbo";
    std::string language = "en";
    long timeoutMs = 180000;
};

/**
 * Whisper transcription client
 */
class Transcriber {
public:
    Transcriber(HttpClient& http, TranscriberOptions options);

    /**
     * Transcribe one file. Returns the trimmed text, which may be empty.
     * Throws TranscriptionFailed on configuration, transport or API errors.
     */
    std::string transcribeFile(const std::string& path);

    /**
     * Transcribe files in order and join the pieces with a single space.
     * Throws TranscriptionEmpty when no speech was found in any file.
     */
    std::string transcribe(const std::vector<std::string>& files, const ProgressCallback& progress = nullptr);

    bool isConfigured() const { return !options.apiKey.empty(); }

private:
    HttpClient& http;
    TranscriberOptions options;
};

} // namespace MediaBot
