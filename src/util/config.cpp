#include "util/config.hpp"

#include "util/home_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace centy {

namespace {

Result TypeError(const char* key, const char* expected) {
    return Result::Fail(-1, std::string("config key '") + key + "' must be " + expected);
}

Result GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return TypeError(key, "a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return TypeError(key, "a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result GetSecondsIfPresent(const nlohmann::json& j, const char* key, long& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return TypeError(key, "an integer");
    const auto v = it->get<long long>();
    if (v < 0)
        return TypeError(key, "a non-negative integer");
    out = static_cast<long>(v);
    return Result::Ok();
}

Result FillConfigFromJson(const nlohmann::json& j, InstallerConfig& cfg) {
    if (!j.is_object())
        return Result::Fail(-1, "config root must be a JSON object");

    for (const auto& r : {
             GetStringIfPresent(j, "ApiBase", cfg.api_base),
             GetStringIfPresent(j, "Repository", cfg.repository),
             GetStringIfPresent(j, "DownloadBase", cfg.download_base),
             GetStringIfPresent(j, "BinaryName", cfg.binary_name),
             GetStringIfPresent(j, "AssetTemplate", cfg.asset_template),
             GetStringIfPresent(j, "ChecksumsName", cfg.checksums_name),
             GetStringIfPresent(j, "InstallDir", cfg.install_dir),
             GetStringIfPresent(j, "UserAgent", cfg.user_agent),
             GetBoolIfPresent(j, "IncludePrereleases", cfg.include_prereleases),
             GetBoolIfPresent(j, "RestartDaemon", cfg.restart_daemon),
             GetSecondsIfPresent(j, "ConnectTimeoutSec", cfg.connect_timeout_sec),
             GetSecondsIfPresent(j, "TimeoutSec", cfg.timeout_sec),
         }) {
        if (!r.is_ok())
            return r;
    }

    std::string level;
    auto lr = GetStringIfPresent(j, "LogLevel", level);
    if (!lr.is_ok())
        return lr;
    if (!level.empty()) {
        auto parsed = ParseLogLevel(level);
        if (!parsed)
            return Result::Fail(-1, "unknown LogLevel: " + level);
        cfg.log_level = *parsed;
    }

    if (cfg.binary_name.empty())
        return Result::Fail(-1, "BinaryName must not be empty");
    if (cfg.repository.empty() && cfg.download_base.empty())
        return Result::Fail(-1, "Repository or DownloadBase must be set");

    return Result::Ok();
}

} // namespace

std::string InstallerConfig::EffectiveDownloadBase() const {
    if (!download_base.empty())
        return download_base;
    return "https://github.com/" + repository + "/releases/download";
}

Result InstallerConfig::LoadFromString(const std::string& json_text, InstallerConfig& out) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("invalid JSON: ") + e.what());
    }
    InstallerConfig cfg = out;
    auto r = FillConfigFromJson(j, cfg);
    if (!r.is_ok())
        return r;
    out = std::move(cfg);
    return Result::Ok();
}

Result InstallerConfig::LoadFromFile(const std::string& path, InstallerConfig& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(-1, "cannot open config: " + path);
    }
    std::stringstream ss;
    ss << is.rdbuf();

    auto r = LoadFromString(ss.str(), out);
    if (!r.is_ok())
        return Result::Fail(r.err, r.msg + " in " + path);
    return Result::Ok();
}

Result LoadInstallerConfig(const std::optional<std::string>& explicit_path, InstallerConfig& out) {
    if (explicit_path && !explicit_path->empty()) {
        return InstallerConfig::LoadFromFile(*explicit_path, out);
    }

    const char* env = std::getenv(kConfigEnvVar);
    if (env && *env) {
        return InstallerConfig::LoadFromFile(env, out);
    }

    auto home = ResolveHomeDir();
    if (!home) {
        return Result::Ok();
    }
    const std::filesystem::path def = *home / ".centy" / "installer.json";
    std::error_code ec;
    if (!std::filesystem::exists(def, ec)) {
        return Result::Ok();
    }
    return InstallerConfig::LoadFromFile(def.string(), out);
}

} // namespace centy
