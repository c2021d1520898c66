#include "centy/downloader.hpp"

#include "util/logger.hpp"

namespace centy {

namespace {

void ReplaceAll(std::string& s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string JoinUrl(std::string base, std::string_view a, std::string_view b) {
    while (!base.empty() && base.back() == '/') base.pop_back();
    base += '/';
    base += a;
    base += '/';
    base += b;
    return base;
}

} // namespace

ReleaseLocation BuildReleaseLocation(const ReleaseNaming& naming,
                                     std::string_view target_triple,
                                     ArchiveKind kind,
                                     std::string_view tag) {
    ReleaseLocation loc;
    loc.tag = std::string(tag);
    loc.kind = kind;

    loc.archive_name = naming.asset_template;
    ReplaceAll(loc.archive_name, "{name}", naming.binary_name);
    ReplaceAll(loc.archive_name, "{tag}", tag);
    ReplaceAll(loc.archive_name, "{target}", target_triple);
    ReplaceAll(loc.archive_name, "{ext}", ArchiveExtension(kind));

    loc.archive_url = JoinUrl(naming.download_base, tag, loc.archive_name);
    loc.checksums_url = JoinUrl(naming.download_base, tag, naming.checksums_name);
    return loc;
}

std::expected<std::vector<std::uint8_t>, std::string>
Downloader::FetchBody(const std::string& url, std::string_view what, IProgress* progress) const {
    HttpRequest req;
    req.url = url;
    req.headers = {"Accept: application/octet-stream"};
    req.progress = progress;
    req.label = std::string(what);

    auto resp = http_.Get(req);
    if (!resp) {
        return std::unexpected("failed to download " + std::string(what) + " " + url + ": " + resp.error());
    }
    if (!resp->IsSuccess()) {
        return std::unexpected("failed to download " + std::string(what) + " " + url + ": HTTP " +
                               std::to_string(resp->status));
    }
    if (resp->body.empty()) {
        return std::unexpected("failed to download " + std::string(what) + " " + url + ": empty body");
    }
    return std::move(resp->body);
}

std::expected<FetchedRelease, std::string> Downloader::Fetch(const ReleaseLocation& location) const {
    LogInfo("Downloading %s", location.archive_url.c_str());
    auto archive = FetchBody(location.archive_url, "archive", progress_);
    if (!archive) return std::unexpected(archive.error());
    LogDebug("archive: %zu bytes", archive->size());

    auto checksums = FetchBody(location.checksums_url, "checksum manifest", nullptr);
    if (!checksums) return std::unexpected(checksums.error());

    const std::string text(checksums->begin(), checksums->end());
    ChecksumManifest manifest = ChecksumManifest::Parse(text);
    if (manifest.Empty()) {
        return std::unexpected("checksum manifest " + location.checksums_url + " has no entries");
    }
    LogDebug("checksum manifest: %zu entries", manifest.Size());

    FetchedRelease out;
    out.artifact.bytes = std::move(*archive);
    out.artifact.source_url = location.archive_url;
    out.manifest = std::move(manifest);
    return out;
}

} // namespace centy
