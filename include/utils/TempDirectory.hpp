#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <filesystem>

namespace MediaBot {

/**
 * Per-run scratch directory
 * Every artifact of a run is written below it and removed as a unit
 */
class TempDirectory {
public:
    // Create a fresh directory under root (system temp dir when empty)
    static std::shared_ptr<TempDirectory> create(const std::string& prefix = "mediabot-extract-",
                                                 const std::string& root = "");

    ~TempDirectory();

    // Prevent copying
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return dirPath; }

    // Build a path inside the directory
    std::filesystem::path file(const std::string& name) const { return dirPath / name; }

    // Remove the directory tree. Idempotent, never throws.
    void cleanup() noexcept;

    bool isCleanedUp() const { return removed.load(); }

private:
    explicit TempDirectory(std::filesystem::path path);

    std::filesystem::path dirPath;
    std::atomic<bool> removed;
};

} // namespace MediaBot
