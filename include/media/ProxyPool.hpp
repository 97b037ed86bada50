#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace MediaBot {

/**
 * Round-robin proxy rotation shared by every run of a process.
 * The list is loaded once; rotation is lock-free.
 */
class ProxyPool {
public:
    ProxyPool() = default;
    explicit ProxyPool(std::vector<std::string> proxies);

    // Prevent copying
    ProxyPool(const ProxyPool&) = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    /**
     * Load a newline-delimited list. Blank lines and '#' comments are
     * skipped. Returns false when the file cannot be read.
     */
    bool load(const std::string& path);

    // Next proxy in rotation, nullopt when the pool is empty
    std::optional<std::string> next();

    size_t size() const { return proxies.size(); }
    bool empty() const { return proxies.empty(); }

private:
    std::vector<std::string> proxies;
    std::atomic<size_t> index{0};
};

} // namespace MediaBot
