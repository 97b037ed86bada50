#include "media/PostProcessor.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <cmath>
#include <cstdlib>

namespace fs = std::filesystem;

namespace MediaBot {

namespace {

double toMB(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

uint64_t fileSizeOrZero(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

void throwIfCancelled(const CommandResult& result) {
    if (result.cancelled) {
        throw PipelineError(ErrorKind::Cancelled, result.error);
    }
}

} // namespace

PostProcessor::PostProcessor(CommandRunner& runner, PostProcessorOptions options)
    : runner(runner)
    , options(std::move(options)) {
}

CommandResult PostProcessor::runFfmpeg(const std::vector<std::string>& args, std::chrono::milliseconds timeout) {
    CommandSpec spec;
    spec.program = options.ffmpeg;
    spec.args = args;
    spec.timeout = timeout;
    CommandResult result = runner.run(spec);
    throwIfCancelled(result);
    return result;
}

void PostProcessor::merge(const std::string& videoPath, const std::string& audioPath, const std::string& outputPath) {
    LOG_PIPE_INFO("Merging video + audio");
    CommandResult result = runFfmpeg({
        "-y", "-i", videoPath, "-i", audioPath,
        "-c", "copy", "-movflags", "+faststart",
        outputPath
    }, options.ffmpegTimeout);

    if (!result.success) {
        throw PipelineError(ErrorKind::MergeFailed, "ffmpeg merge failed: " + truncateText(result.error));
    }
    if (fileSizeOrZero(outputPath) == 0) {
        throw PipelineError(ErrorKind::MergeFailed, "ffmpeg merge produced no output");
    }
}

double PostProcessor::probeDuration(const std::string& path, ErrorKind failureKind) {
    CommandSpec spec;
    spec.program = options.ffprobe;
    spec.args = {"-i", path, "-show_entries", "format=duration", "-v", "quiet", "-of", "csv=p=0"};
    spec.timeout = options.probeTimeout;

    CommandResult result = runner.run(spec);
    throwIfCancelled(result);
    if (!result.success) {
        throw PipelineError(failureKind, "ffprobe failed: " + truncateText(result.error));
    }

    const std::string text = UrlUtils::trim(result.output);
    char* end = nullptr;
    const double duration = std::strtod(text.c_str(), &end);
    if (text.empty() || end == text.c_str() || !std::isfinite(duration) || duration <= 0) {
        throw PipelineError(failureKind, "Invalid duration: " + truncateText(text, 100));
    }
    return duration;
}

long PostProcessor::computeTwoPassBitrate(double targetMB, double durationSec) {
    if (durationSec <= 0) {
        return 0;
    }
    return static_cast<long>(std::floor((targetMB * 8192.0) / durationSec - 128.0));
}

int PostProcessor::computeChunkCount(double durationSec, int chunkSeconds) {
    if (durationSec <= 0 || chunkSeconds <= 0) {
        return 0;
    }
    return static_cast<int>(std::ceil(durationSec / static_cast<double>(chunkSeconds)));
}

std::optional<std::string> PostProcessor::archiveOriginal(const std::string& path, const fs::path& outputDir) {
    const fs::path dir = options.archiveDir.empty() ? outputDir / "originals" : fs::path(options.archiveDir);
    const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string extension = fs::path(path).extension().string();
    const fs::path target = dir / ("original-" + std::to_string(stamp) + (extension.empty() ? ".mp4" : extension));

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec) {
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    if (!ec) {
        fs::copy_file(path, target, fs::copy_options::overwrite_existing, ec);
    }
    if (ec) {
        LOG_PIPE_WARN("Failed to archive original {}: {}", path, ec.message());
        return std::nullopt;
    }

    LOG_PIPE_INFO("Saved original ({:.1f}MB) to {}", toMB(fileSizeOrZero(target)), target.string());
    return target.string();
}

CompressionResult PostProcessor::compressToFit(const std::string& inputPath,
                                               const fs::path& outputDir,
                                               const ProgressCallback& progress) {
    CompressionResult result;
    result.path = inputPath;
    result.size = fileSizeOrZero(inputPath);

    if (result.size <= options.maxVideoBytes) {
        return result;
    }

    result.archivePath = archiveOriginal(inputPath, outputDir);
    if (progress) {
        progress("Compressing video...");
    }

    // Stage 1: constant quality at 720p
    LOG_PIPE_INFO("Video {:.1f}MB exceeds limit, trying CRF compress", toMB(result.size));
    const std::string crfPath = (outputDir / "video_crf.mp4").string();
    CommandResult crf = runFfmpeg({
        "-y", "-i", inputPath,
        "-c:v", "libx264", "-crf", "28", "-preset", "medium",
        "-vf", "scale=-2:720",
        "-c:a", "aac", "-b:a", "128k",
        "-movflags", "+faststart",
        crfPath
    }, options.compressTimeout);
    result.stagesRun = 1;

    if (!crf.success) {
        throw PipelineError(ErrorKind::CompressionFailed, "ffmpeg CRF compress failed: " + truncateText(crf.error));
    }

    const uint64_t crfSize = fileSizeOrZero(crfPath);
    if (crfSize == 0) {
        throw PipelineError(ErrorKind::CompressionFailed, "ffmpeg CRF compress produced no output");
    }
    LOG_PIPE_INFO("CRF compress: {:.1f}MB", toMB(crfSize));

    if (crfSize <= options.maxVideoBytes) {
        result.path = crfPath;
        result.size = crfSize;
        return result;
    }

    // Stage 2: two-pass at a fixed bitrate derived from the target size
    const double duration = probeDuration(inputPath, ErrorKind::CompressionFailed);
    const long bitrate = computeTwoPassBitrate(options.twoPassTargetMB, duration);
    if (bitrate <= 0) {
        throw PipelineError(ErrorKind::CompressionFailed, "content too long for target size");
    }
    LOG_PIPE_INFO("CRF still too large, two-pass at {}k for {:.0f}MB target", bitrate, options.twoPassTargetMB);

    const std::string twoPassPath = (outputDir / "video_2pass.mp4").string();
    const std::string passLog = (outputDir / "ffmpeg2pass").string();
    const std::string bitrateArg = std::to_string(bitrate) + "k";
    result.stagesRun = 2;

    CommandResult pass1 = runFfmpeg({
        "-y", "-i", inputPath,
        "-c:v", "libx264", "-b:v", bitrateArg,
        "-pass", "1", "-passlogfile", passLog,
        "-an", "-f", "mp4",
        "/dev/null"
    }, options.compressTimeout);
    if (!pass1.success) {
        throw PipelineError(ErrorKind::CompressionFailed,
                            "ffmpeg two-pass (pass 1) failed: " + truncateText(pass1.error));
    }

    CommandResult pass2 = runFfmpeg({
        "-y", "-i", inputPath,
        "-c:v", "libx264", "-b:v", bitrateArg,
        "-pass", "2", "-passlogfile", passLog,
        "-c:a", "aac", "-b:a", "128k",
        "-movflags", "+faststart",
        twoPassPath
    }, options.compressTimeout);
    if (!pass2.success) {
        throw PipelineError(ErrorKind::CompressionFailed,
                            "ffmpeg two-pass (pass 2) failed: " + truncateText(pass2.error));
    }

    const uint64_t twoPassSize = fileSizeOrZero(twoPassPath);
    if (twoPassSize == 0) {
        throw PipelineError(ErrorKind::CompressionFailed, "ffmpeg two-pass produced no output");
    }
    LOG_PIPE_INFO("Two-pass compress: {:.1f}MB", toMB(twoPassSize));

    if (twoPassSize > options.maxVideoBytes) {
        throw PipelineError(ErrorKind::SizeExceeded, "Video is too large even after compression");
    }

    result.path = twoPassPath;
    result.size = twoPassSize;
    return result;
}

std::vector<std::string> PostProcessor::chunkAudio(const std::string& inputPath, const fs::path& outputDir) {
    const double duration = probeDuration(inputPath, ErrorKind::TranscriptionFailed);
    const int numChunks = computeChunkCount(duration, options.chunkSeconds);

    if (numChunks <= 1) {
        return {inputPath};
    }

    LOG_ASR_INFO("Splitting {:.0f}s of audio into {} chunks", duration, numChunks);
    std::vector<std::string> chunks;
    for (int i = 0; i < numChunks; ++i) {
        const std::string chunkPath = (outputDir / ("chunk_" + std::to_string(i) + ".mp3")).string();

        CommandResult result = runFfmpeg({
            "-y",
            "-i", inputPath,
            "-ss", std::to_string(static_cast<long long>(i) * options.chunkSeconds),
            "-t", std::to_string(options.chunkSeconds),
            "-c:a", "libmp3lame",
            "-q:a", "2",
            chunkPath
        }, options.ffmpegTimeout);

        if (!result.success) {
            throw PipelineError(ErrorKind::TranscriptionFailed,
                                "Audio chunking failed: " + truncateText(result.error));
        }

        if (fileSizeOrZero(chunkPath) > 0) {
            chunks.push_back(chunkPath);
        }
    }

    if (chunks.empty()) {
        throw PipelineError(ErrorKind::TranscriptionFailed, "Audio chunking produced no output");
    }
    return chunks;
}

std::vector<std::string> PostProcessor::prepareForTranscription(const std::string& audioPath) {
    if (fileSizeOrZero(audioPath) <= options.maxTranscribeBytes) {
        return {audioPath};
    }

    const fs::path chunkDir = fs::path(audioPath).parent_path() / "chunks";
    std::error_code ec;
    fs::create_directories(chunkDir, ec);
    if (ec) {
        throw PipelineError(ErrorKind::TranscriptionFailed,
                            "Could not create chunk directory: " + ec.message());
    }
    return chunkAudio(audioPath, chunkDir);
}

} // namespace MediaBot
