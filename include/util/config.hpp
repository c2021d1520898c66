#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace centy {

constexpr const char kConfigEnvVar[] = "CENTY_INSTALLER_CONFIG";

struct InstallerConfig {
    std::string api_base = "https://api.github.com";
    std::string repository = "centy-io/centy-daemon";
    std::string download_base;  // empty => https://github.com/<repository>/releases/download
    std::string binary_name = "centy-daemon";
    std::string asset_template = "{name}-{target}.{ext}";
    std::string checksums_name = "checksums-sha256.txt";
    std::string install_dir;    // empty => <home>/.centy/bin
    bool include_prereleases = true;
    long connect_timeout_sec = 15;
    long timeout_sec = 300;
    std::string user_agent = "centy-installer";
    LogLevel log_level = LogLevel::Info;
    bool restart_daemon = true;

    std::string EffectiveDownloadBase() const;

    // Keys absent from the file keep their defaults.
    static Result LoadFromFile(const std::string& path, InstallerConfig& out);
    static Result LoadFromString(const std::string& json_text, InstallerConfig& out);
};

// Picks the config file: explicit path, else $CENTY_INSTALLER_CONFIG, else
// <home>/.centy/installer.json. Only the implicit default may be absent.
Result LoadInstallerConfig(const std::optional<std::string>& explicit_path, InstallerConfig& out);

} // namespace centy
