#include "utils/UrlGuard.hpp"
#include "utils/UrlUtils.hpp"
#include "utils/Logger.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstdint>
#include <cstring>

namespace MediaBot {

namespace {

bool isPrivateV4(uint32_t addr) {
    const uint8_t a = static_cast<uint8_t>(addr >> 24);
    const uint8_t b = static_cast<uint8_t>((addr >> 16) & 0xff);

    if (a == 0) return true;                            // 0.0.0.0/8
    if (a == 10) return true;                           // 10.0.0.0/8
    if (a == 127) return true;                          // loopback
    if (a == 169 && b == 254) return true;              // link-local
    if (a == 172 && b >= 16 && b <= 31) return true;    // 172.16.0.0/12
    if (a == 192 && b == 168) return true;              // 192.168.0.0/16
    if (a == 100 && b >= 64 && b <= 127) return true;   // CGNAT 100.64.0.0/10
    if (a >= 224) return true;                          // multicast and reserved
    return false;
}

bool isPrivateV6(const in6_addr& addr) {
    const uint8_t* bytes = addr.s6_addr;

    static const uint8_t zeros[16] = {0};
    if (std::memcmp(bytes, zeros, 15) == 0 && (bytes[15] == 0 || bytes[15] == 1)) {
        return true;                                    // :: and ::1
    }
    if ((bytes[0] & 0xfe) == 0xfc) return true;         // fc00::/7 unique-local
    if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80) return true;   // fe80::/10
    if (bytes[0] == 0xff) return true;                  // multicast

    // IPv4-mapped ::ffff:a.b.c.d
    bool mapped = std::memcmp(bytes, zeros, 10) == 0 && bytes[10] == 0xff && bytes[11] == 0xff;
    if (mapped) {
        uint32_t v4 = (static_cast<uint32_t>(bytes[12]) << 24) |
                      (static_cast<uint32_t>(bytes[13]) << 16) |
                      (static_cast<uint32_t>(bytes[14]) << 8) |
                      static_cast<uint32_t>(bytes[15]);
        return isPrivateV4(v4);
    }
    return false;
}

} // namespace

UrlGuard::UrlGuard(bool allowPrivateNetworks)
    : allowPrivateNetworks(allowPrivateNetworks) {
}

bool UrlGuard::isPrivateAddress(const std::string& address) {
    in_addr v4{};
    if (inet_pton(AF_INET, address.c_str(), &v4) == 1) {
        return isPrivateV4(ntohl(v4.s_addr));
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
        return isPrivateV6(v6);
    }

    // Not an address literal
    return false;
}

bool UrlGuard::isUrlAllowed(const std::string& url) const {
    auto parsed = UrlUtils::parse(url);
    if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https")) {
        LOG_PIPE_DEBUG("Rejected non-http(s) URL: {}", url);
        return false;
    }

    if (allowPrivateNetworks) {
        return true;
    }

    std::string host = parsed->host;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    if (host == "localhost" || (host.size() > 10 && host.compare(host.size() - 10, 10, ".localhost") == 0)) {
        return false;
    }

    const auto addresses = resolveHost(host);
    if (addresses.empty()) {
        LOG_PIPE_WARN("Could not resolve host {}, refusing URL", host);
        return false;
    }

    for (const auto& address : addresses) {
        if (isPrivateAddress(address)) {
            LOG_PIPE_WARN("Blocked URL {} (host {} resolves to {})", url, host, address);
            return false;
        }
    }
    return true;
}

std::vector<std::string> UrlGuard::resolveHost(const std::string& host) {
    std::vector<std::string> addresses;

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* info = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &info);
    if (rc != 0) {
        LOG_PIPE_DEBUG("getaddrinfo({}) failed: {}", host, gai_strerror(rc));
        return addresses;
    }

    for (auto* entry = info; entry != nullptr; entry = entry->ai_next) {
        char buffer[INET6_ADDRSTRLEN] = {0};
        if (entry->ai_family == AF_INET) {
            auto* sa = reinterpret_cast<sockaddr_in*>(entry->ai_addr);
            inet_ntop(AF_INET, &sa->sin_addr, buffer, sizeof(buffer));
        } else if (entry->ai_family == AF_INET6) {
            auto* sa = reinterpret_cast<sockaddr_in6*>(entry->ai_addr);
            inet_ntop(AF_INET6, &sa->sin6_addr, buffer, sizeof(buffer));
        } else {
            continue;
        }
        addresses.emplace_back(buffer);
    }

    freeaddrinfo(info);
    return addresses;
}

} // namespace MediaBot
