#include "utils/HttpClient.hpp"
#include <cpr/cpr.h>

namespace MediaBot {

namespace {

cpr::Header toCprHeader(const HttpHeaders& headers) {
    cpr::Header header;
    for (const auto& entry : headers) {
        header[entry.first] = entry.second;
    }
    return header;
}

HttpResponse fromCpr(const cpr::Response& response) {
    HttpResponse result;
    result.statusCode = response.status_code;
    result.body = response.text;
    if (response.error) {
        result.error = response.error.message;
    }
    return result;
}

} // namespace

HttpResponse CprHttpClient::get(const std::string& url,
                                const HttpHeaders& headers,
                                long timeoutMs) {
    cpr::Response response = cpr::Get(
        cpr::Url{url},
        toCprHeader(headers),
        cpr::Timeout{timeoutMs}
    );
    return fromCpr(response);
}

HttpResponse CprHttpClient::postMultipart(const std::string& url,
                                          const HttpHeaders& headers,
                                          const std::string& filePath,
                                          const std::vector<std::pair<std::string, std::string>>& fields,
                                          long timeoutMs) {
    cpr::Multipart multipart{cpr::Part{"file", cpr::File{filePath}}};
    for (const auto& field : fields) {
        multipart.parts.emplace_back(field.first, field.second);
    }

    cpr::Response response = cpr::Post(
        cpr::Url{url},
        toCprHeader(headers),
        multipart,
        cpr::Timeout{timeoutMs}
    );
    return fromCpr(response);
}

} // namespace MediaBot
