#pragma once

#include "centy/progress.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace centy {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    IProgress* progress = nullptr;
    std::string label;                // shown by progress sinks
};

struct HttpResponse {
    long status = 0;
    std::vector<std::uint8_t> body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
    std::string BodyText() const { return std::string(body.begin(), body.end()); }
};

// Transport seam. The error arm carries transport failures only (DNS,
// connect, TLS, timeout, cancel); every HTTP status is a response.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual std::expected<HttpResponse, std::string> Get(const HttpRequest& request) = 0;
};

} // namespace centy
