#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace MediaBot {

/**
 * URL parsing helpers
 * Handles the absolute http(s) URLs the pipeline deals with
 */
class UrlUtils {
public:
    // Longer input is not treated as a URL
    static constexpr size_t kMaxUrlLength = 8192;

    struct ParsedUrl {
        std::string scheme;     // lowercase
        std::string host;       // lowercase, brackets kept for IPv6
        std::string port;
        std::string path;       // "/" when empty
        std::string query;      // includes leading '?'
    };

    /**
     * Parse an absolute URL
     * Returns nullopt when the text is not scheme://host... or is longer
     * than kMaxUrlLength
     */
    static std::optional<ParsedUrl> parse(const std::string& url);

    // Rebuild a URL string (fragment dropped)
    static std::string build(const ParsedUrl& url);

    // True for http:// and https:// URLs with a host
    static bool isHttpUrl(const std::string& url);

    // Lowercase host or empty string
    static std::string hostOf(const std::string& url);

    /**
     * Resolve a reference (absolute, scheme-relative, root-relative or
     * relative) against a base URL
     */
    static std::string resolve(const std::string& base, const std::string& reference);

    /**
     * Extension of the last path segment including the dot, e.g. ".mp4"
     */
    static std::string extension(const std::string& url, const std::string& fallback);

    static std::string toLower(const std::string& text);

    // Trim ASCII whitespace from both ends
    static std::string trim(const std::string& text);

private:
    static std::string removeDotSegments(const std::string& path);
};

} // namespace MediaBot
