#include "centy/pipeline.hpp"

#include "centy/archive_extractor.hpp"
#include "centy/binary_installer.hpp"
#include "centy/verifier.hpp"
#include "net/curl_http_client.hpp"
#include "util/home_dir.hpp"
#include "util/logger.hpp"

namespace fs = std::filesystem;

namespace centy {

namespace {

std::unexpected<InstallError> Fail(InstallErrorKind kind, std::string message) {
    LogDebug("%s: %s", ToString(kind), message.c_str());
    return std::unexpected(InstallError{kind, std::move(message)});
}

} // namespace

const char* ToString(InstallErrorKind kind) {
    switch (kind) {
        case InstallErrorKind::Platform:          return "platform detection failed";
        case InstallErrorKind::VersionResolution: return "version resolution failed";
        case InstallErrorKind::Download:          return "download failed";
        case InstallErrorKind::Extraction:        return "extraction failed";
        case InstallErrorKind::Installation:      return "installation failed";
    }
    return "install failed";
}

std::string InstallError::Describe() const {
    return std::string(ToString(kind)) + ": " + message;
}

InstallPipeline::InstallPipeline(IHttpClient& http, Options opt) : http_(http), opt_(std::move(opt)) {}

std::expected<fs::path, InstallError>
InstallPipeline::Run(const std::optional<std::string>& version) const {
    // Detect
    const HostInfo host = opt_.host ? *opt_.host : ProbeHost();
    auto platform = DetectPlatform(host);
    if (!platform) return Fail(InstallErrorKind::Platform, platform.error());

    const std::string_view triple = TargetTriple(*platform);
    const ArchiveKind kind = ArchiveKindFor(platform->os);
    LogInfo("Platform: %.*s (%.*s)", (int)triple.size(), triple.data(),
            (int)ArchiveExtension(kind).size(), ArchiveExtension(kind).data());

    // Resolve
    VersionResolver resolver(http_, opt_.resolver);
    auto tag = resolver.Resolve(version);
    if (!tag) return Fail(InstallErrorKind::VersionResolution, tag.error());

    // Download
    const ReleaseLocation location = BuildReleaseLocation(opt_.naming, triple, kind, *tag);
    Downloader downloader(http_, opt_.progress);
    auto fetched = downloader.Fetch(location);
    if (!fetched) return Fail(InstallErrorKind::Download, fetched.error());

    // Verify
    ArtifactVerifier verifier;
    auto vr = verifier.Verify(fetched->artifact, fetched->manifest, location.archive_name);
    if (!vr.is_ok()) return Fail(InstallErrorKind::Download, vr.msg);
    LogInfo("Checksum verified for %s", location.archive_name.c_str());

    // Extract
    const std::string exe_name = ExecutableName(opt_.naming.binary_name, platform->os);
    ExtractedBinary binary;
    ArchiveExtractor extractor;
    auto xr = extractor.Extract(fetched->artifact.bytes, kind, exe_name, binary);
    if (!xr.is_ok()) return Fail(InstallErrorKind::Extraction, xr.msg);
    // The archive is no longer needed once the binary is out.
    fetched->artifact.bytes.clear();
    fetched->artifact.bytes.shrink_to_fit();

    // Install
    fs::path dir = opt_.install_dir;
    if (dir.empty()) {
        auto home = ResolveHomeDir();
        if (!home) return Fail(InstallErrorKind::Installation, home.error());
        dir = InstallDirFor(*home);
    }
    std::error_code ec;
    dir = fs::absolute(dir, ec);
    if (ec) {
        return Fail(InstallErrorKind::Installation,
                    "cannot resolve install directory " + dir.string() + ": " + ec.message());
    }

    InstalledBinary installed;
    BinaryInstaller installer;
    auto ir = installer.Install(binary, dir / exe_name, installed);
    if (!ir.is_ok()) return Fail(InstallErrorKind::Installation, ir.msg);

    LogInfo("%s %s installed to %s", opt_.naming.binary_name.c_str(), tag->c_str(),
            installed.path.c_str());
    return installed.path;
}

InstallPipeline::Options PipelineOptionsFromConfig(const InstallerConfig& cfg) {
    InstallPipeline::Options opt;
    opt.resolver.api_base = cfg.api_base;
    opt.resolver.repository = cfg.repository;
    opt.resolver.include_prereleases = cfg.include_prereleases;
    opt.naming.download_base = cfg.EffectiveDownloadBase();
    opt.naming.binary_name = cfg.binary_name;
    opt.naming.asset_template = cfg.asset_template;
    opt.naming.checksums_name = cfg.checksums_name;
    opt.install_dir = cfg.install_dir;
    return opt;
}

std::expected<fs::path, InstallError>
InstallBinary(const std::optional<std::string>& version, const InstallerConfig& cfg, IProgress* progress) {
    CurlHttpClient::Options copt;
    copt.user_agent = cfg.user_agent;
    copt.connect_timeout_sec = cfg.connect_timeout_sec;
    copt.timeout_sec = cfg.timeout_sec;
    CurlHttpClient http(copt);

    auto opt = PipelineOptionsFromConfig(cfg);
    opt.progress = progress;
    InstallPipeline pipeline(http, std::move(opt));
    return pipeline.Run(version);
}

} // namespace centy
