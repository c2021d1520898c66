#pragma once

#include "centy/downloader.hpp"
#include "centy/platform.hpp"
#include "centy/progress.hpp"
#include "centy/version_resolver.hpp"
#include "net/http_client.hpp"
#include "util/config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace centy {

// One kind per pipeline stage; callers branch on the kind, humans read the message.
enum class InstallErrorKind {
    Platform,
    VersionResolution,
    Download,
    Extraction,
    Installation,
};

const char* ToString(InstallErrorKind kind);

struct InstallError {
    InstallErrorKind kind;
    std::string message;

    std::string Describe() const;
};

// Detect -> Resolve -> Download -> Verify -> Extract -> Install. The first
// failing stage aborts the run; nothing touches the install path before the
// final rename.
class InstallPipeline {
public:
    struct Options {
        VersionResolver::Options resolver;
        ReleaseNaming naming;
        std::filesystem::path install_dir; // empty => <home>/.centy/bin
        std::optional<HostInfo> host;      // empty => ProbeHost()
        IProgress* progress = nullptr;
    };

    InstallPipeline(IHttpClient& http, Options opt);

    std::expected<std::filesystem::path, InstallError> Run(const std::optional<std::string>& version) const;

private:
    IHttpClient& http_;
    Options opt_;
};

InstallPipeline::Options PipelineOptionsFromConfig(const InstallerConfig& cfg);

// Entry point for wrappers: real host, libcurl transport.
std::expected<std::filesystem::path, InstallError>
InstallBinary(const std::optional<std::string>& version,
              const InstallerConfig& cfg,
              IProgress* progress = nullptr);

} // namespace centy
