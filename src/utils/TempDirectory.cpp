#include "utils/TempDirectory.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <stdlib.h>
#include <vector>

namespace MediaBot {

TempDirectory::TempDirectory(std::filesystem::path path)
    : dirPath(std::move(path))
    , removed(false) {
}

TempDirectory::~TempDirectory() {
    cleanup();
}

std::shared_ptr<TempDirectory> TempDirectory::create(const std::string& prefix, const std::string& root) {
    std::filesystem::path base = root.empty()
        ? std::filesystem::temp_directory_path()
        : std::filesystem::path(root);

    std::error_code ec;
    std::filesystem::create_directories(base, ec);

    // mkdtemp rewrites the trailing XXXXXX in place
    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create temp directory under " + base.string() +
                                 ": " + std::strerror(errno));
    }

    auto dir = std::shared_ptr<TempDirectory>(new TempDirectory(std::filesystem::path(buffer.data())));
    LOG_PIPE_DEBUG("Created temp directory {}", dir->path().string());
    return dir;
}

void TempDirectory::cleanup() noexcept {
    if (removed.exchange(true)) {
        return;
    }

    std::error_code ec;
    const auto count = std::filesystem::remove_all(dirPath, ec);
    if (ec) {
        LOG_PIPE_WARN("Cleanup of {} failed: {}", dirPath.string(), ec.message());
        return;
    }

    LOG_PIPE_DEBUG("Removed temp directory {} ({} entries)", dirPath.string(), count);
}

} // namespace MediaBot
