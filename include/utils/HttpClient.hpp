#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>

namespace MediaBot {

/**
 * HTTP response as seen by the pipeline
 */
struct HttpResponse {
    long statusCode = 0;        // 0 when the request never completed
    std::string body;
    std::string error;          // transport error text

    bool ok() const { return statusCode >= 200 && statusCode < 300; }
};

using HttpHeaders = std::map<std::string, std::string>;

/**
 * Minimal HTTP surface used by manifest fetch and transcription
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             long timeoutMs) = 0;

    // multipart/form-data POST with one file part named "file"
    virtual HttpResponse postMultipart(const std::string& url,
                                       const HttpHeaders& headers,
                                       const std::string& filePath,
                                       const std::vector<std::pair<std::string, std::string>>& fields,
                                       long timeoutMs) = 0;
};

/**
 * cpr-backed client
 */
class CprHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const HttpHeaders& headers,
                     long timeoutMs) override;

    HttpResponse postMultipart(const std::string& url,
                               const HttpHeaders& headers,
                               const std::string& filePath,
                               const std::vector<std::pair<std::string, std::string>>& fields,
                               long timeoutMs) override;
};

} // namespace MediaBot
