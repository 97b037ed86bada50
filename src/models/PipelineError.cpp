#include "models/PipelineError.hpp"

namespace MediaBot {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceNotFound: return "SourceNotFound";
        case ErrorKind::ProtocolRejected: return "ProtocolRejected";
        case ErrorKind::ManifestInvalid: return "ManifestInvalid";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::MergeFailed: return "MergeFailed";
        case ErrorKind::CompressionFailed: return "CompressionFailed";
        case ErrorKind::TranscriptionFailed: return "TranscriptionFailed";
        case ErrorKind::TranscriptionEmpty: return "TranscriptionEmpty";
        case ErrorKind::SizeExceeded: return "SizeExceeded";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string truncateText(const std::string& text, size_t maxLength) {
    // Trim whitespace
    const size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(start, end - start + 1);

    if (trimmed.size() <= maxLength) {
        return trimmed;
    }
    return trimmed.substr(0, maxLength) + "...";
}

} // namespace MediaBot
