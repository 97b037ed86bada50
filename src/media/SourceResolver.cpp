#include "media/SourceResolver.hpp"
#include "models/PipelineError.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <cctype>
#include <chrono>
#include <regex>
#include <vector>

namespace MediaBot {

namespace {

const char* const kUserAgent = "mediabot/1.0";
constexpr std::chrono::milliseconds kCurlTimeout{35000};

bool hostMatches(const std::string& host, const std::string& domain) {
    if (host == domain) return true;
    return host.size() > domain.size() &&
           host.compare(host.size() - domain.size(), domain.size(), domain) == 0 &&
           host[host.size() - domain.size() - 1] == '.';
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool isIdChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

void throwIfCancelled(const CommandResult& result) {
    if (result.cancelled) {
        throw PipelineError(ErrorKind::Cancelled, result.error);
    }
}

} // namespace

Platform detectPlatform(const std::string& url) {
    const std::string host = UrlUtils::hostOf(url);
    if (host.empty()) {
        return Platform::Unknown;
    }

    if (hostMatches(host, "youtube.com") || hostMatches(host, "youtu.be") ||
        hostMatches(host, "youtube-nocookie.com")) {
        return Platform::YouTube;
    }
    if (hostMatches(host, "instagram.com") || hostMatches(host, "instagr.am")) {
        return Platform::Instagram;
    }
    if (hostMatches(host, "tiktok.com")) {
        return Platform::TikTok;
    }
    if (hostMatches(host, "reddit.com") || hostMatches(host, "redd.it")) {
        return Platform::Reddit;
    }
    return Platform::Unknown;
}

RedditSourceResolver::RedditSourceResolver(CommandRunner& runner, UrlPredicate isAllowed, std::string curl)
    : runner(runner)
    , isAllowed(std::move(isAllowed))
    , curl(std::move(curl)) {
}

std::optional<std::string> RedditSourceResolver::normalizeInput(const std::string& input) {
    const std::string trimmed = UrlUtils::trim(input);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    size_t end = 0;
    while (end < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[end]))) {
        ++end;
    }
    return trimmed.substr(0, end);
}

std::optional<std::string> RedditSourceResolver::ensureUrl(const std::string& token) {
    static const std::regex postId("^[a-z0-9]{5,10}$", std::regex::icase);
    static const std::vector<std::string> redditPrefixes = {
        "reddit.com", "old.reddit.com", "new.reddit.com", "m.reddit.com", "redd.it", "v.redd.it"
    };

    std::string url;
    if (startsWith(token, "http://") || startsWith(token, "https://")) {
        url = token;
    } else if (startsWith(token, "www.")) {
        url = "https://" + token;
    } else {
        for (const auto& prefix : redditPrefixes) {
            if (startsWith(token, prefix)) {
                url = "https://" + token;
                break;
            }
        }
        if (url.empty() && std::regex_match(token, postId)) {
            url = "https://www.reddit.com/comments/" + token;
        }
    }

    if (url.empty() || !UrlUtils::isHttpUrl(url)) {
        return std::nullopt;
    }
    return url;
}

bool RedditSourceResolver::isRedditHost(const std::string& host) {
    return host == "reddit.com" || hostMatches(host, "reddit.com") || host == "redd.it";
}

std::string RedditSourceResolver::dashUrlFromId(const std::string& id) {
    return "https://v.redd.it/" + id + "/DASHPlaylist.mpd";
}

std::string RedditSourceResolver::unescapeHtml(const std::string& html) {
    std::string result;
    result.reserve(html.size());
    for (size_t i = 0; i < html.size(); ++i) {
        if (html.compare(i, 6, "\\u0026") == 0) {
            result += '&';
            i += 5;
        } else if (html.compare(i, 2, "\\/") == 0) {
            result += '/';
            i += 1;
        } else {
            result += html[i];
        }
    }
    return result;
}

std::optional<std::string> RedditSourceResolver::extractDashUrl(const std::string& html) {
    const std::string normalized = unescapeHtml(html);
    const std::string lowered = UrlUtils::toLower(normalized);
    const std::string marker = "v.redd.it/";
    const std::string suffix = "/dashplaylist.mpd";

    // Full manifest URL first
    for (size_t pos = lowered.find(marker); pos != std::string::npos; pos = lowered.find(marker, pos + 1)) {
        size_t idEnd = pos + marker.size();
        while (idEnd < lowered.size() && isIdChar(lowered[idEnd])) ++idEnd;
        if (idEnd == pos + marker.size() || lowered.compare(idEnd, suffix.size(), suffix) != 0) {
            continue;
        }

        size_t start = std::string::npos;
        if (pos >= 8 && lowered.compare(pos - 8, 8, "https://") == 0) {
            start = pos - 8;
        } else if (pos >= 7 && lowered.compare(pos - 7, 7, "http://") == 0) {
            start = pos - 7;
        }
        if (start != std::string::npos) {
            return normalized.substr(start, idEnd + suffix.size() - start);
        }
    }

    // Bare v.redd.it/<id> reference
    for (size_t pos = lowered.find(marker); pos != std::string::npos; pos = lowered.find(marker, pos + 1)) {
        size_t idEnd = pos + marker.size();
        while (idEnd < lowered.size() && isIdChar(lowered[idEnd])) ++idEnd;
        if (idEnd > pos + marker.size()) {
            return dashUrlFromId(normalized.substr(pos + marker.size(), idEnd - pos - marker.size()));
        }
    }

    return std::nullopt;
}

std::optional<std::string> RedditSourceResolver::extractExternalUrl(const std::string& html) {
    static const std::regex imageUrl(R"(\.(jpg|jpeg|png|gif|webp)(\?|$))", std::regex::icase);
    const std::string attr = "data-url=\"";

    for (size_t pos = html.find(attr); pos != std::string::npos; pos = html.find(attr, pos + 1)) {
        const size_t valueStart = pos + attr.size();
        const size_t valueEnd = html.find('"', valueStart);
        if (valueEnd == std::string::npos) {
            return std::nullopt;
        }
        const std::string url = html.substr(valueStart, valueEnd - valueStart);
        if (!startsWith(url, "http://") && !startsWith(url, "https://")) {
            continue;
        }

        // Only the first absolute embed is considered
        if (url.find("reddit.com") != std::string::npos || url.find("redd.it") != std::string::npos) {
            return std::nullopt;
        }
        if (std::regex_search(url, imageUrl)) {
            return std::nullopt;
        }
        if (!UrlUtils::isHttpUrl(url)) {
            return std::nullopt;
        }
        return url;
    }
    return std::nullopt;
}

std::string RedditSourceResolver::toOldReddit(const std::string& url) {
    auto parsed = UrlUtils::parse(url);
    if (!parsed) {
        return url;
    }
    if (parsed->host == "www.reddit.com" || parsed->host == "new.reddit.com" ||
        parsed->host == "m.reddit.com" || parsed->host == "reddit.com") {
        parsed->host = "old.reddit.com";
    }
    return UrlUtils::build(*parsed);
}

bool RedditSourceResolver::allowed(const std::string& url, const char* what) const {
    if (isAllowed && !isAllowed(url)) {
        LOG_PIPE_WARN("Blocked {} (private network): {}", what, url);
        return false;
    }
    return true;
}

std::optional<std::string> RedditSourceResolver::resolveFinalUrl(const std::string& url) {
    CommandSpec spec;
    spec.program = curl;
    spec.args = {
        "-sS", "-L",
        "-o", "/dev/null",
        "-w", "%{url_effective}",
        "-H", std::string("User-Agent: ") + kUserAgent,
        "--connect-timeout", "15",
        "--max-time", "30",
        url
    };
    spec.timeout = kCurlTimeout;

    CommandResult result = runner.run(spec);
    throwIfCancelled(result);
    if (!result.success) {
        LOG_PIPE_WARN("Failed to resolve URL {}: {}", url, truncateText(result.error, 200));
        return std::nullopt;
    }

    const std::string effective = UrlUtils::trim(result.output);
    return effective.empty() ? url : effective;
}

std::optional<std::string> RedditSourceResolver::fetchHtml(const std::string& url) {
    CommandSpec spec;
    spec.program = curl;
    spec.args = {
        "-sS", "-L", "-f",
        "-H", std::string("User-Agent: ") + kUserAgent,
        "-b", "over18=1",
        "--connect-timeout", "15",
        "--max-time", "30",
        url
    };
    spec.timeout = kCurlTimeout;

    CommandResult result = runner.run(spec);
    throwIfCancelled(result);
    if (!result.success) {
        LOG_PIPE_WARN("Failed to fetch page {}: {}", url, truncateText(result.error, 200));
        return std::nullopt;
    }
    if (result.output.empty()) {
        LOG_PIPE_WARN("Empty response from page {}", url);
        return std::nullopt;
    }
    return result.output;
}

VideoSource RedditSourceResolver::resolve(const std::string& input) {
    auto token = normalizeInput(input);
    if (!token) {
        return NoSource{};
    }
    LOG_PIPE_DEBUG("Resolving input token: {}", *token);

    if (token->find("DASHPlaylist.mpd") != std::string::npos) {
        auto url = ensureUrl(*token);
        if (!url || !allowed(*url, "manifest URL")) {
            return NoSource{};
        }
        return DashSource{*url};
    }

    auto candidate = ensureUrl(*token);
    if (!candidate || !allowed(*candidate, "URL")) {
        return NoSource{};
    }

    auto parsed = UrlUtils::parse(*candidate);
    if (!parsed) {
        return NoSource{};
    }

    if (parsed->host == "v.redd.it") {
        const std::string path = parsed->path.substr(1);
        const std::string id = path.substr(0, path.find('/'));
        if (id.empty()) {
            return NoSource{};
        }
        return DashSource{dashUrlFromId(id)};
    }

    if (!isRedditHost(parsed->host)) {
        LOG_PIPE_DEBUG("Not a Reddit host: {}", parsed->host);
        return NoSource{};
    }

    auto finalUrl = resolveFinalUrl(*candidate);
    if (!finalUrl || !allowed(*finalUrl, "redirect target")) {
        return NoSource{};
    }

    auto finalParsed = UrlUtils::parse(*finalUrl);
    if (!finalParsed || !isRedditHost(finalParsed->host)) {
        LOG_PIPE_DEBUG("Redirect left Reddit: {}", *finalUrl);
        return NoSource{};
    }

    const std::string pageUrl = toOldReddit(*finalUrl);
    auto html = fetchHtml(pageUrl);
    if (!html) {
        return NoSource{};
    }
    LOG_PIPE_DEBUG("Fetched {} ({} chars)", pageUrl, html->size());

    if (auto dashUrl = extractDashUrl(*html)) {
        if (!allowed(*dashUrl, "manifest URL")) {
            return NoSource{};
        }
        return DashSource{*dashUrl};
    }

    if (auto externalUrl = extractExternalUrl(*html)) {
        if (!allowed(*externalUrl, "external URL")) {
            return NoSource{};
        }
        LOG_PIPE_INFO("Found external video embed: {}", *externalUrl);
        return ExternalSource{*externalUrl};
    }

    LOG_PIPE_INFO("No video source found in {}", pageUrl);
    return NoSource{};
}

} // namespace MediaBot
