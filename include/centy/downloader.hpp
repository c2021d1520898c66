#pragma once

#include "centy/checksum_manifest.hpp"
#include "centy/platform.hpp"
#include "net/http_client.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace centy {

struct ReleaseNaming {
    std::string download_base = "https://github.com/centy-io/centy-daemon/releases/download";
    std::string binary_name = "centy-daemon";
    // Placeholders: {name} {tag} {target} {ext}
    std::string asset_template = "{name}-{target}.{ext}";
    std::string checksums_name = "checksums-sha256.txt";
};

struct ReleaseLocation {
    std::string tag;
    std::string archive_name;
    std::string archive_url;
    std::string checksums_url;
    ArchiveKind kind = ArchiveKind::TarGz;
};

ReleaseLocation BuildReleaseLocation(const ReleaseNaming& naming,
                                     std::string_view target_triple,
                                     ArchiveKind kind,
                                     std::string_view tag);

struct DownloadedArtifact {
    std::vector<std::uint8_t> bytes;
    std::string source_url;
};

struct FetchedRelease {
    DownloadedArtifact artifact;
    ChecksumManifest manifest;
};

class Downloader {
public:
    explicit Downloader(IHttpClient& http, IProgress* progress = nullptr)
        : http_(http), progress_(progress) {}

    // Both the archive and its checksum manifest must arrive, or nothing is returned.
    std::expected<FetchedRelease, std::string> Fetch(const ReleaseLocation& location) const;

private:
    std::expected<std::vector<std::uint8_t>, std::string>
    FetchBody(const std::string& url, std::string_view what, IProgress* progress) const;

    IHttpClient& http_;
    IProgress* progress_ = nullptr;
};

} // namespace centy
