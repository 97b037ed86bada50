#include "delivery/TelegramDelivery.hpp"
#include "delivery/MessageFormat.hpp"
#include "utils/Logger.hpp"
#include <filesystem>

namespace MediaBot {

TelegramDelivery::TelegramDelivery(const std::string& token)
    : bot(std::make_unique<TgBot::Bot>(token)) {
}

bool TelegramDelivery::initialize() {
    try {
        auto me = bot->getApi().getMe();
        LOG_PIPE_INFO("Delivering as @{}", me->username);
        return true;
    } catch (const std::exception& e) {
        LOG_PIPE_ERROR("Failed to initialize bot: {}", e.what());
        return false;
    }
}

bool TelegramDelivery::deliver(std::int64_t chatId, const ExtractResult& result) {
    bool ok = true;

    for (const auto& warning : result.warnings) {
        try {
            bot->getApi().sendMessage(chatId, "Warning: " + warning);
        } catch (const TgBot::TgException& e) {
            LOG_PIPE_WARN("Failed to send warning: {}", e.what());
            ok = false;
        }
    }

    if (result.transcript) {
        ok = sendTranscript(chatId, result) && ok;
    }
    if (result.subtitlePath) {
        const std::string mime = result.subtitleFormat == SubtitleFormat::Vtt ? "text/vtt" : "application/x-subrip";
        ok = sendFile(chatId, "document", *result.subtitlePath, mime) && ok;
    }
    if (result.audioPath) {
        ok = sendFile(chatId, "audio", *result.audioPath, "audio/mpeg") && ok;
    }
    if (result.videoPath) {
        ok = sendFile(chatId, "video", *result.videoPath, "video/mp4") && ok;
    }

    return ok;
}

bool TelegramDelivery::sendTranscript(std::int64_t chatId, const ExtractResult& result) {
    const std::string& transcript = *result.transcript;

    try {
        if (auto message = MessageFormat::transcriptMessage(result.title, transcript)) {
            bot->getApi().sendMessage(chatId, *message);
            return true;
        }

        auto file = std::make_shared<TgBot::InputFile>();
        file->data = transcript;
        file->mimeType = "text/plain";
        file->fileName = "transcript.txt";
        bot->getApi().sendDocument(chatId, file);
        return true;
    } catch (const TgBot::TgException& e) {
        LOG_PIPE_ERROR("Failed to send transcript: {}", e.what());
        return false;
    }
}

bool TelegramDelivery::sendFile(std::int64_t chatId, const std::string& kind, const std::string& path, const std::string& mimeType) {
    try {
        auto file = TgBot::InputFile::fromFile(path, mimeType);
        if (kind == "video") {
            bot->getApi().sendVideo(chatId, file);
        } else if (kind == "audio") {
            bot->getApi().sendAudio(chatId, file);
        } else {
            bot->getApi().sendDocument(chatId, file);
        }
        LOG_PIPE_INFO("Sent {} {}", kind, std::filesystem::path(path).filename().string());
        return true;
    } catch (const std::exception& e) {
        LOG_PIPE_ERROR("Failed to send {} {}: {}", kind, path, e.what());
        return false;
    }
}

} // namespace MediaBot
