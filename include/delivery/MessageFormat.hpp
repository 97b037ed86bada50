#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace MediaBot {

class MessageFormat {
public:
    // Stays under Telegram's 4096 character cap
    static constexpr size_t kMaxMessageLength = 4000;

    /**
     * Title and transcript joined into one chat message, or nullopt when the
     * whole message would exceed kMaxMessageLength
     */
    static std::optional<std::string> transcriptMessage(const std::string& title,
                                                        const std::string& transcript);
};

} // namespace MediaBot
