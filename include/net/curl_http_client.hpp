#pragma once

#include "net/http_client.hpp"

#include <string>

namespace centy {

class CurlHttpClient final : public IHttpClient {
public:
    struct Options {
        std::string user_agent = "centy-installer";
        long connect_timeout_sec = 15;
        long timeout_sec = 300;  // 0 => no limit
        bool follow_redirects = true;
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options opt);

    std::expected<HttpResponse, std::string> Get(const HttpRequest& request) override;

private:
    Options opt_;
};

} // namespace centy
