#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace MediaBot {

namespace {

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '.' || c == '-';
}

} // namespace

std::optional<UrlUtils::ParsedUrl> UrlUtils::parse(const std::string& url) {
    if (url.empty() || url.size() > kMaxUrlLength) {
        return std::nullopt;
    }

    // scheme "://"
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return std::nullopt;
    }
    size_t pos = 1;
    while (pos < url.size() && isSchemeChar(url[pos])) ++pos;
    if (url.compare(pos, 3, "://") != 0) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, pos));
    pos += 3;

    const size_t authorityEnd = std::min(url.find_first_of("/?#", pos), url.size());
    std::string authority = url.substr(pos, authorityEnd - pos);
    const size_t at = authority.find('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        const size_t closing = authority.find(']');
        if (closing == std::string::npos) {
            return std::nullopt;
        }
        parsed.host = authority.substr(0, closing + 1);
        const std::string rest = authority.substr(closing + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') {
                return std::nullopt;
            }
            portText = rest.substr(1);
        }
    } else {
        const size_t colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            portText = authority.substr(colon + 1);
        }
    }
    if (!std::all_of(portText.begin(), portText.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    parsed.host = toLower(parsed.host);
    parsed.port = portText;

    const size_t fragment = std::min(url.find('#', authorityEnd), url.size());
    const size_t question = url.find('?', authorityEnd);
    if (question != std::string::npos && question < fragment) {
        parsed.path = url.substr(authorityEnd, question - authorityEnd);
        parsed.query = url.substr(question, fragment - question);
    } else {
        parsed.path = url.substr(authorityEnd, fragment - authorityEnd);
    }

    if (parsed.host.empty()) {
        return std::nullopt;
    }
    if (parsed.path.empty()) {
        parsed.path = "/";
    }
    return parsed;
}

std::string UrlUtils::build(const ParsedUrl& url) {
    std::string result = url.scheme + "://" + url.host;
    if (!url.port.empty()) {
        result += ":" + url.port;
    }
    result += url.path.empty() ? "/" : url.path;
    result += url.query;
    return result;
}

bool UrlUtils::isHttpUrl(const std::string& url) {
    auto parsed = parse(url);
    return parsed && (parsed->scheme == "http" || parsed->scheme == "https");
}

std::string UrlUtils::hostOf(const std::string& url) {
    auto parsed = parse(url);
    return parsed ? parsed->host : "";
}

std::string UrlUtils::resolve(const std::string& base, const std::string& reference) {
    const std::string ref = trim(reference);
    if (parse(ref)) {
        return ref;
    }

    auto parsedBase = parse(base);
    if (!parsedBase) {
        // Base is unusable, fall back to plain directory concatenation
        const size_t slash = base.find_last_of('/');
        return (slash == std::string::npos ? base + "/" : base.substr(0, slash + 1)) + ref;
    }

    if (ref.rfind("//", 0) == 0) {
        return parsedBase->scheme + ":" + ref;
    }

    ParsedUrl result = *parsedBase;
    std::string refPath = ref;
    std::string refQuery;
    const size_t fragment = refPath.find('#');
    if (fragment != std::string::npos) {
        refPath.erase(fragment);
    }
    const size_t question = refPath.find('?');
    if (question != std::string::npos) {
        refQuery = refPath.substr(question);
        refPath.erase(question);
    }

    if (refPath.empty()) {
        // Query-only reference keeps the base path
        if (!refQuery.empty()) {
            result.query = refQuery;
        }
        return build(result);
    }

    if (refPath[0] == '/') {
        result.path = removeDotSegments(refPath);
    } else {
        const size_t slash = parsedBase->path.find_last_of('/');
        const std::string directory = slash == std::string::npos ? "/" : parsedBase->path.substr(0, slash + 1);
        result.path = removeDotSegments(directory + refPath);
    }
    result.query = refQuery;
    return build(result);
}

std::string UrlUtils::extension(const std::string& url, const std::string& fallback) {
    auto parsed = parse(url);
    if (!parsed) {
        return fallback;
    }

    const std::string& path = parsed->path;
    const size_t slash = path.find_last_of('/');
    const std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == segment.size()) {
        return fallback;
    }
    return segment.substr(dot);
}

std::string UrlUtils::toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

std::string UrlUtils::trim(const std::string& text) {
    const size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string UrlUtils::removeDotSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 1;     // skip leading '/'
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        segments.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<std::string> output;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        const bool last = i + 1 == segments.size();
        if (segment == ".") {
            if (last) output.push_back("");
        } else if (segment == "..") {
            if (!output.empty()) output.pop_back();
            if (last) output.push_back("");
        } else {
            output.push_back(segment);
        }
    }

    std::string result;
    for (const auto& segment : output) {
        result += "/" + segment;
    }
    return result.empty() ? "/" : result;
}

} // namespace MediaBot
