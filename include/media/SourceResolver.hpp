#pragma once

#include "models/MediaTypes.hpp"
#include "utils/ProcessRunner.hpp"
#include <optional>
#include <string>

namespace MediaBot {

/**
 * Classify a URL by host into a platform family
 */
Platform detectPlatform(const std::string& url);

/**
 * Turns user input into a concrete fetch target
 */
class VideoSourceResolver {
public:
    virtual ~VideoSourceResolver() = default;

    // Never throws for lookup failures; returns NoSource instead
    virtual VideoSource resolve(const std::string& input) = 0;
};

/**
 * Reddit resolver
 * Handles v.redd.it links, post IDs, direct manifests and post pages
 * (scraped from old.reddit.com). Every hop is checked with the allow-list
 * predicate.
 */
class RedditSourceResolver : public VideoSourceResolver {
public:
    RedditSourceResolver(CommandRunner& runner, UrlPredicate isAllowed, std::string curl = "curl");

    VideoSource resolve(const std::string& input) override;

    // First whitespace-separated token
    static std::optional<std::string> normalizeInput(const std::string& input);

    // Token to absolute http(s) URL; nullopt for anything else
    static std::optional<std::string> ensureUrl(const std::string& token);

    static bool isRedditHost(const std::string& host);

    static std::string dashUrlFromId(const std::string& id);

    // Undo JSON escaping found in embedded page data
    static std::string unescapeHtml(const std::string& html);

    static std::optional<std::string> extractDashUrl(const std::string& html);
    static std::optional<std::string> extractExternalUrl(const std::string& html);

    // www./new./m./bare hosts become old.reddit.com
    static std::string toOldReddit(const std::string& url);

private:
    CommandRunner& runner;
    UrlPredicate isAllowed;
    std::string curl;

    std::optional<std::string> resolveFinalUrl(const std::string& url);
    std::optional<std::string> fetchHtml(const std::string& url);
    bool allowed(const std::string& url, const char* what) const;
};

} // namespace MediaBot
