#pragma once

#include <stdexcept>
#include <string>

namespace MediaBot {

/**
 * Failure categories surfaced by the pipeline
 */
enum class ErrorKind {
    SourceNotFound,
    ProtocolRejected,       // URL refused by the allow-list
    ManifestInvalid,
    DownloadFailed,
    MergeFailed,
    CompressionFailed,
    TranscriptionFailed,
    TranscriptionEmpty,     // call succeeded but no speech was detected
    SizeExceeded,
    Cancelled
};

std::string errorKindToString(ErrorKind kind);

/**
 * Error raised by a pipeline stage
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , errorKind(kind) {
    }

    ErrorKind kind() const { return errorKind; }

private:
    ErrorKind errorKind;
};

/**
 * Cut external tool output down to a size that is safe to surface
 */
std::string truncateText(const std::string& text, size_t maxLength = 500);

} // namespace MediaBot
