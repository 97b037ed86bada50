#include "media/ManifestParser.hpp"
#include "utils/HttpClient.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace MediaBot {

namespace {

const char* const kUserAgent = "mediabot/1.0";

struct Candidate {
    bool found = false;
    unsigned long long bandwidth = 0;
    std::string url;
};

unsigned long long parseBandwidth(const std::string& value) {
    unsigned long long result = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
        if (result > (~0ULL - 9) / 10) {
            return ~0ULL;
        }
        result = result * 10 + static_cast<unsigned long long>(c - '0');
    }
    return result;
}

std::string decodeEntities(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, 5, "&amp;") == 0) {
            result += '&';
            i += 4;
        } else {
            result += text[i];
        }
    }
    return result;
}

bool isTagBoundary(const std::string& text, size_t pos) {
    if (pos >= text.size()) return false;
    const char c = text[pos];
    return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

} // namespace

std::optional<ManifestParser::Element> ManifestParser::nextElement(const std::string& text,
                                                                   const std::string& lowered,
                                                                   const std::string& tag,
                                                                   size_t from,
                                                                   size_t limit) {
    const std::string open = "<" + tag;
    const std::string close = "</" + tag;

    size_t start = lowered.find(open, from);
    while (start != std::string::npos && start < limit && !isTagBoundary(lowered, start + open.size())) {
        start = lowered.find(open, start + open.size());
    }
    if (start == std::string::npos || start >= limit) {
        return std::nullopt;
    }

    const size_t tagEnd = lowered.find('>', start);
    if (tagEnd == std::string::npos || tagEnd >= limit) {
        return std::nullopt;
    }

    Element element;
    element.start = start;
    const size_t attrStart = start + open.size();
    element.attributes = text.substr(attrStart, tagEnd - attrStart);

    if (!element.attributes.empty() && element.attributes.back() == '/') {
        element.attributes.pop_back();
        element.end = tagEnd + 1;
        return element;
    }

    const size_t closing = lowered.find(close, tagEnd + 1);
    if (closing == std::string::npos || closing >= limit) {
        return std::nullopt;
    }

    element.body = text.substr(tagEnd + 1, closing - tagEnd - 1);
    const size_t closeEnd = lowered.find('>', closing);
    element.end = closeEnd == std::string::npos ? lowered.size() : closeEnd + 1;
    return element;
}

std::string ManifestParser::attribute(const std::string& attributes, const std::string& name) {
    const std::string lowered = UrlUtils::toLower(attributes);
    const std::string key = UrlUtils::toLower(name);

    for (size_t pos = lowered.find(key); pos != std::string::npos; pos = lowered.find(key, pos + 1)) {
        if (pos > 0 && !std::isspace(static_cast<unsigned char>(lowered[pos - 1]))) {
            continue;
        }
        size_t cursor = pos + key.size();
        while (cursor < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[cursor]))) ++cursor;
        if (cursor >= lowered.size() || lowered[cursor] != '=') {
            continue;
        }
        ++cursor;
        while (cursor < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[cursor]))) ++cursor;
        if (cursor >= lowered.size() || lowered[cursor] != '"') {
            continue;
        }
        const size_t valueStart = cursor + 1;
        const size_t valueEnd = attributes.find('"', valueStart);
        if (valueEnd == std::string::npos) {
            return "";
        }
        if (valueEnd - valueStart > kMaxAttributeLength) {
            LOG_DL_WARN("Oversized {} attribute ({} bytes), ignoring", name, valueEnd - valueStart);
            return "";
        }
        return attributes.substr(valueStart, valueEnd - valueStart);
    }
    return "";
}

std::optional<std::string> ManifestParser::firstBaseUrl(const std::string& text) {
    const std::string lowered = UrlUtils::toLower(text);
    auto element = nextElement(text, lowered, "baseurl", 0, lowered.size());
    if (!element) {
        return std::nullopt;
    }
    std::string value = UrlUtils::trim(decodeEntities(element->body));
    if (value.empty()) {
        return std::nullopt;
    }
    if (value.size() > UrlUtils::kMaxUrlLength) {
        LOG_DL_WARN("Oversized BaseURL ({} bytes), ignoring", value.size());
        return std::nullopt;
    }
    return value;
}

std::optional<ManifestSelection> ManifestParser::parse(const std::string& xml,
                                                       const std::string& manifestUrl) {
    if (xml.size() > kMaxManifestBytes) {
        LOG_DL_WARN("DASH manifest too large ({} bytes), skipping", xml.size());
        return std::nullopt;
    }

    const std::string lowered = UrlUtils::toLower(xml);
    Candidate bestVideo;
    Candidate bestAudio;

    int groupCount = 0;
    int representationCount = 0;
    bool exhausted = false;
    size_t pos = 0;

    while (!exhausted) {
        auto group = nextElement(xml, lowered, "adaptationset", pos, lowered.size());
        if (!group) {
            break;
        }
        pos = group->end;

        if (++groupCount > kMaxAdaptationSets) {
            LOG_DL_WARN("Too many AdaptationSets, stopping parse");
            break;
        }

        std::string groupType = attribute(group->attributes, "contentType");
        if (groupType.empty()) {
            groupType = attribute(group->attributes, "mimeType");
        }

        // Collect representations first so the group-level BaseURL can be
        // looked up outside of them
        const std::string groupBody = group->body;
        const std::string groupLowered = UrlUtils::toLower(groupBody);
        std::vector<Element> representations;
        std::string outside;
        size_t repPos = 0;

        while (true) {
            auto rep = nextElement(groupBody, groupLowered, "representation", repPos, groupLowered.size());
            if (!rep) {
                break;
            }
            outside += groupBody.substr(repPos, rep->start - repPos);
            repPos = rep->end;
            representations.push_back(*rep);
        }
        outside += groupBody.substr(std::min(repPos, groupBody.size()));

        const auto groupBase = firstBaseUrl(outside);

        for (const auto& rep : representations) {
            if (++representationCount > kMaxRepresentations) {
                LOG_DL_WARN("Too many Representations, stopping parse");
                exhausted = true;
                break;
            }

            std::string type = groupType;
            if (type.empty()) {
                type = attribute(rep.attributes, "contentType");
            }
            if (type.empty()) {
                type = attribute(rep.attributes, "mimeType");
            }
            const std::string loweredType = UrlUtils::toLower(type);

            auto base = firstBaseUrl(rep.body);
            if (!base) {
                base = groupBase;
            }
            if (!base) {
                continue;
            }

            const unsigned long long bandwidth = parseBandwidth(attribute(rep.attributes, "bandwidth"));
            const std::string resolved = UrlUtils::resolve(manifestUrl, *base);

            Candidate* target = nullptr;
            if (loweredType.find("video") != std::string::npos) {
                target = &bestVideo;
            } else if (loweredType.find("audio") != std::string::npos) {
                target = &bestAudio;
            }

            // Strict comparison keeps the first of equal bandwidths
            if (target && (!target->found || bandwidth > target->bandwidth)) {
                target->found = true;
                target->bandwidth = bandwidth;
                target->url = resolved;
            }
        }
    }

    if (!bestVideo.found && !bestAudio.found) {
        return std::nullopt;
    }

    ManifestSelection selection;
    if (bestVideo.found) selection.videoUrl = bestVideo.url;
    if (bestAudio.found) selection.audioUrl = bestAudio.url;
    return selection;
}

std::optional<ManifestSelection> ManifestParser::fetch(HttpClient& http,
                                                       const std::string& manifestUrl,
                                                       long timeoutMs) {
    HttpResponse response = http.get(manifestUrl, {{"User-Agent", kUserAgent}}, timeoutMs);
    if (!response.ok()) {
        LOG_DL_WARN("DASH fetch failed for {}: {} {}", manifestUrl, response.statusCode, response.error);
        return std::nullopt;
    }
    return parse(response.body, manifestUrl);
}

} // namespace MediaBot
