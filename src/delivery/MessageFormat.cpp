#include "delivery/MessageFormat.hpp"

namespace MediaBot {

std::optional<std::string> MessageFormat::transcriptMessage(const std::string& title,
                                                            const std::string& transcript) {
    std::string message = title.empty() ? transcript : title + "\n\n" + transcript;
    if (message.size() > kMaxMessageLength) {
        return std::nullopt;
    }
    return message;
}

} // namespace MediaBot
