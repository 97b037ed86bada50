#include "media/Transcriber.hpp"
#include "models/PipelineError.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace MediaBot {

using json = nlohmann::json;

Transcriber::Transcriber(HttpClient& http, TranscriberOptions options)
    : http(http)
    , options(std::move(options)) {
}

std::string Transcriber::transcribeFile(const std::string& path) {
    if (options.apiKey.empty()) {
        throw PipelineError(ErrorKind::TranscriptionFailed, "GROQ_API_KEY not configured");
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw PipelineError(ErrorKind::TranscriptionFailed, "Cannot read audio file " + path + ": " + ec.message());
    }
    LOG_ASR_INFO("Transcribing {} ({} bytes)", std::filesystem::path(path).filename().string(), size);

    HttpResponse response = http.postMultipart(
        options.endpoint,
        {{"Authorization", "Bearer " + options.apiKey}},
        path,
        {
            {"model", options.model},
            {"language", options.language},
            {"response_format", "json"}
        },
        options.timeoutMs
    );

    if (response.statusCode == 0) {
        throw PipelineError(ErrorKind::TranscriptionFailed,
                            "Transcription request failed: " + truncateText(response.error, 300));
    }

    if (!response.ok()) {
        LOG_ASR_ERROR("Transcription API returned {}", response.statusCode);
        throw PipelineError(ErrorKind::TranscriptionFailed,
                            "Transcription API error " + std::to_string(response.statusCode) + ": " +
                            truncateText(response.body, 300));
    }

    try {
        json body = json::parse(response.body);
        if (body.contains("text") && body["text"].is_string()) {
            return UrlUtils::trim(body["text"].get<std::string>());
        }
        return "";
    } catch (const json::exception& e) {
        throw PipelineError(ErrorKind::TranscriptionFailed,
                            "Failed to parse transcription response: " + std::string(e.what()));
    }
}

std::string Transcriber::transcribe(const std::vector<std::string>& files, const ProgressCallback& progress) {
    if (files.empty()) {
        throw PipelineError(ErrorKind::TranscriptionFailed, "No audio to transcribe");
    }

    if (files.size() == 1) {
        std::string text = transcribeFile(files.front());
        if (text.empty()) {
            throw PipelineError(ErrorKind::TranscriptionEmpty, "No speech detected");
        }
        return text;
    }

    // Every chunk keeps its slot in the joined text, silent ones included
    std::string transcript;
    bool anySpeech = false;
    for (size_t i = 0; i < files.size(); ++i) {
        if (progress) {
            progress("Transcribing chunk " + std::to_string(i + 1) + "/" + std::to_string(files.size()) + "...");
        }
        const std::string text = transcribeFile(files[i]);
        if (text.empty()) {
            LOG_ASR_WARN("Chunk {}/{} contained no speech", i + 1, files.size());
        } else {
            anySpeech = true;
        }
        if (i > 0) {
            transcript += ' ';
        }
        transcript += text;
    }

    if (!anySpeech) {
        throw PipelineError(ErrorKind::TranscriptionEmpty, "No speech detected");
    }
    LOG_ASR_INFO("Transcribed {} chunks ({} chars)", files.size(), transcript.size());
    return transcript;
}

} // namespace MediaBot
