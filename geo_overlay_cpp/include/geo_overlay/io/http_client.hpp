#pragma once

#include "geo_overlay/config/configuration.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geo_overlay::io {

struct HttpResponse {
    long status = 0;
    std::string content_type;
    std::vector<uint8_t> body;
};

// Blocking GET of an image or other binary resource.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Returns the body of a 2xx response. Throws NetworkError otherwise.
    virtual std::vector<uint8_t> fetch(const std::string& url) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const config::NetworkConfig& cfg);

    std::vector<uint8_t> fetch(const std::string& url) override;

    // Single attempt, no status check. Throws NetworkError on transport errors.
    HttpResponse get(const std::string& url) const;

private:
    config::NetworkConfig cfg_;
};

// Replaces the value of credential-looking query parameters (key, token,
// access_token, signature) so URLs can be logged.
std::string redact_url(const std::string& url);

} // namespace geo_overlay::io
