#include "centy/version_resolver.hpp"

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

namespace centy {

using json = nlohmann::json;

namespace {

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool IsLatestSentinel(std::string_view s) {
    return s.empty() || s == "latest";
}

bool BoolField(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

std::string NormalizeVersionTag(std::string_view raw) {
    const std::string_view v = Trim(raw);
    if (!v.empty() && v.front() == 'v') return std::string(v);
    return "v" + std::string(v);
}

VersionResolver::VersionResolver(IHttpClient& http, Options opt) : http_(http), opt_(std::move(opt)) {}

std::string VersionResolver::ReleasesUrl() const {
    std::string base = opt_.api_base;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/repos/" + opt_.repository + "/releases";
}

std::expected<std::string, std::string>
VersionResolver::Resolve(const std::optional<std::string>& requested) const {
    if (requested) {
        const std::string_view v = Trim(*requested);
        if (!IsLatestSentinel(v)) {
            std::string tag = NormalizeVersionTag(v);
            LogInfo("Using requested version %s", tag.c_str());
            return tag;
        }
    }
    return FetchLatestTag();
}

std::expected<std::string, std::string> VersionResolver::FetchLatestTag() const {
    HttpRequest req;
    req.url = ReleasesUrl();
    req.headers = {"Accept: application/vnd.github+json"};

    LogInfo("Resolving latest release from %s", req.url.c_str());

    auto resp = http_.Get(req);
    if (!resp) {
        return std::unexpected("failed to fetch releases from " + req.url + ": " + resp.error());
    }
    if (!resp->IsSuccess()) {
        return std::unexpected("release index " + req.url + " returned HTTP " + std::to_string(resp->status));
    }

    json releases;
    try {
        releases = json::parse(resp->BodyText());
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("failed to parse releases JSON: ") + e.what());
    }

    if (!releases.is_array()) {
        return std::unexpected("failed to parse releases JSON: root must be an array");
    }

    // The index lists most-recently-published first; that order is authoritative.
    for (const auto& release : releases) {
        if (!release.is_object()) {
            return std::unexpected("failed to parse releases JSON: release entry must be an object");
        }
        if (BoolField(release, "draft")) continue;
        if (!opt_.include_prereleases && BoolField(release, "prerelease")) continue;

        auto it = release.find("tag_name");
        if (it == release.end() || !it->is_string() || it->get<std::string>().empty()) {
            return std::unexpected("no releases found: newest release has no tag_name");
        }
        const std::string tag = it->get<std::string>();
        LogInfo("Latest release is %s%s", tag.c_str(),
                BoolField(release, "prerelease") ? " (pre-release)" : "");
        return tag;
    }

    return std::unexpected("no releases found in " + req.url);
}

} // namespace centy
