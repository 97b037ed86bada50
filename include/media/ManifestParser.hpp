#pragma once

#include "models/MediaTypes.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace MediaBot {

class HttpClient;

/**
 * Bounded DASH manifest parser
 * Picks the highest-bandwidth video and audio representation. Input size
 * and element counts are capped so hostile manifests cannot stall a run.
 */
class ManifestParser {
public:
    static constexpr size_t kMaxManifestBytes = 512 * 1024;
    static constexpr int kMaxAdaptationSets = 20;
    static constexpr int kMaxRepresentations = 50;
    static constexpr long kFetchTimeoutMs = 15000;
    static constexpr size_t kMaxAttributeLength = 4096;

    /**
     * Parse manifest XML. BaseURLs are resolved against manifestUrl.
     * Returns nullopt when the manifest is oversized or neither a video
     * nor an audio representation was found. Never throws.
     */
    static std::optional<ManifestSelection> parse(const std::string& xml,
                                                  const std::string& manifestUrl);

    /**
     * GET the manifest and parse it
     */
    static std::optional<ManifestSelection> fetch(HttpClient& http,
                                                  const std::string& manifestUrl,
                                                  long timeoutMs = kFetchTimeoutMs);

private:
    struct Element {
        std::string attributes;
        std::string body;
        size_t start = 0;
        size_t end = 0;         // offset just past the element
    };

    static std::optional<Element> nextElement(const std::string& text,
                                              const std::string& lowered,
                                              const std::string& tag,
                                              size_t from,
                                              size_t limit);

    static std::string attribute(const std::string& attributes, const std::string& name);
    static std::optional<std::string> firstBaseUrl(const std::string& text);
};

} // namespace MediaBot
