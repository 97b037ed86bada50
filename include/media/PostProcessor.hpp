#pragma once

#include "models/MediaTypes.hpp"
#include "models/PipelineError.hpp"
#include "utils/ProcessRunner.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace MediaBot {

/**
 * ffmpeg/ffprobe settings and size ceilings
 */
struct PostProcessorOptions {
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    std::chrono::milliseconds ffmpegTimeout{120000};
    std::chrono::milliseconds compressTimeout{300000};
    std::chrono::milliseconds probeTimeout{15000};
    uint64_t maxVideoBytes = 50ULL * 1024 * 1024;
    double twoPassTargetMB = 49;
    uint64_t maxTranscribeBytes = 25ULL * 1024 * 1024;
    int chunkSeconds = 600;
    std::string archiveDir;         // empty = <outputDir>/originals
};

/**
 * Outcome of compressToFit()
 */
struct CompressionResult {
    std::string path;
    uint64_t size = 0;
    int stagesRun = 0;              // 0 when the input already fit
    std::optional<std::string> archivePath;
};

/**
 * Merge, compression and chunking stages built on ffmpeg
 */
class PostProcessor {
public:
    PostProcessor(CommandRunner& runner, PostProcessorOptions options);

    // Mux video and audio without re-encoding; throws MergeFailed
    void merge(const std::string& videoPath, const std::string& audioPath, const std::string& outputPath);

    // Container duration in seconds; throws failureKind on bad output
    double probeDuration(const std::string& path, ErrorKind failureKind = ErrorKind::CompressionFailed);

    /**
     * Bring a video under the size ceiling.
     * Stage 1 is a CRF re-encode at 720p; stage 2 a two-pass encode at the
     * target size. The original is archived before any encoding.
     * Throws CompressionFailed or SizeExceeded.
     */
    CompressionResult compressToFit(const std::string& inputPath,
                                    const std::filesystem::path& outputDir,
                                    const ProgressCallback& progress = nullptr);

    /**
     * Files to send to the speech-to-text provider: the input itself when
     * it fits the provider ceiling, otherwise time-based mp3 chunks
     */
    std::vector<std::string> prepareForTranscription(const std::string& audioPath);

    // Split into chunkSeconds pieces under outputDir
    std::vector<std::string> chunkAudio(const std::string& inputPath, const std::filesystem::path& outputDir);

    // floor(targetMB * 8192 / duration - 128) in kbit/s
    static long computeTwoPassBitrate(double targetMB, double durationSec);

    static int computeChunkCount(double durationSec, int chunkSeconds);

    // Copy the original aside; failures are logged only
    std::optional<std::string> archiveOriginal(const std::string& path, const std::filesystem::path& outputDir);

    const PostProcessorOptions& getOptions() const { return options; }

private:
    CommandRunner& runner;
    PostProcessorOptions options;

    CommandResult runFfmpeg(const std::vector<std::string>& args, std::chrono::milliseconds timeout);
};

} // namespace MediaBot
