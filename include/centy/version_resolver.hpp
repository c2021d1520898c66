#pragma once

#include "net/http_client.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace centy {

// "0.1.0" -> "v0.1.0"; "v0.1.0" unchanged. Surrounding whitespace is trimmed.
std::string NormalizeVersionTag(std::string_view raw);

class VersionResolver {
public:
    struct Options {
        std::string api_base = "https://api.github.com";
        std::string repository = "centy-io/centy-daemon";
        // Pre-releases are eligible "latest" candidates unless disabled.
        bool include_prereleases = true;
    };

    VersionResolver(IHttpClient& http, Options opt);

    // A present, non-empty request other than "latest" is normalized and
    // returned without consulting the release index.
    std::expected<std::string, std::string> Resolve(const std::optional<std::string>& requested) const;

    std::string ReleasesUrl() const;

private:
    std::expected<std::string, std::string> FetchLatestTag() const;

    IHttpClient& http_;
    Options opt_;
};

} // namespace centy
