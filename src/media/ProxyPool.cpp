#include "media/ProxyPool.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <fstream>

namespace MediaBot {

ProxyPool::ProxyPool(std::vector<std::string> proxies)
    : proxies(std::move(proxies)) {
}

bool ProxyPool::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DL_WARN("Failed to load proxy list from {}", path);
        return false;
    }

    std::vector<std::string> loaded;
    std::string line;
    while (std::getline(file, line)) {
        std::string entry = UrlUtils::trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }
        loaded.push_back(entry);
    }

    proxies = std::move(loaded);
    index.store(0);
    LOG_DL_INFO("Loaded {} proxies from {}", proxies.size(), path);
    return true;
}

std::optional<std::string> ProxyPool::next() {
    if (proxies.empty()) {
        return std::nullopt;
    }
    const size_t current = index.fetch_add(1);
    return proxies[current % proxies.size()];
}

} // namespace MediaBot
