#pragma once

#include <string>
#include <vector>

namespace MediaBot {

/**
 * Private-network containment for outbound fetches
 * A URL is allowed only when it is http(s) and every address its host
 * resolves to is publicly routable.
 */
class UrlGuard {
public:
    explicit UrlGuard(bool allowPrivateNetworks = false);

    // Predicate suitable for UrlPredicate
    bool isUrlAllowed(const std::string& url) const;

    // Literal address check (IPv4 dotted or IPv6 text form)
    static bool isPrivateAddress(const std::string& address);

private:
    bool allowPrivateNetworks;

    static std::vector<std::string> resolveHost(const std::string& host);
};

} // namespace MediaBot
