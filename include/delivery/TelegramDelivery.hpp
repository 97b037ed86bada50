#pragma once

#include "models/MediaTypes.hpp"
#include <tgbot/tgbot.h>
#include <cstdint>
#include <memory>
#include <string>

namespace MediaBot {

/**
 * Sends a finished ExtractResult to a Telegram chat
 */
class TelegramDelivery {
public:
    explicit TelegramDelivery(const std::string& token);

    // Verify the token with getMe
    bool initialize();

    /**
     * Send every artifact present in the result.
     * Returns false if any part failed to send.
     */
    bool deliver(std::int64_t chatId, const ExtractResult& result);

private:
    std::unique_ptr<TgBot::Bot> bot;

    // Transcripts too long for one message go out as transcript.txt
    bool sendTranscript(std::int64_t chatId, const ExtractResult& result);
    bool sendFile(std::int64_t chatId, const std::string& kind, const std::string& path, const std::string& mimeType);
};

} // namespace MediaBot
