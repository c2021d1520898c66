#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config.hpp"

#include <cstdlib>
#include <filesystem>

namespace centy {

namespace {

// Restores an environment variable when the test ends.
class ScopedEnv {
  public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) old_ = old;
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

  private:
    const char* name_;
    std::optional<std::string> old_;
};

} // namespace

TEST(InstallerConfigTest, DefaultsMatchPublishedRelease) {
    const InstallerConfig cfg;
    EXPECT_EQ(cfg.repository, "centy-io/centy-daemon");
    EXPECT_EQ(cfg.binary_name, "centy-daemon");
    EXPECT_EQ(cfg.EffectiveDownloadBase(), "https://github.com/centy-io/centy-daemon/releases/download");
    EXPECT_TRUE(cfg.include_prereleases);
    EXPECT_TRUE(cfg.restart_daemon);
    EXPECT_EQ(cfg.log_level, LogLevel::Info);
}

TEST(InstallerConfigTest, ParsesAllKeys) {
    InstallerConfig cfg;
    auto r = InstallerConfig::LoadFromString(R"({
        "ApiBase": "https://ghe.example.test/api/v3",
        "Repository": "acme/daemon",
        "DownloadBase": "https://mirror.example.test/releases",
        "BinaryName": "acme-daemon",
        "AssetTemplate": "{name}-{tag}-{target}.{ext}",
        "ChecksumsName": "SHA256SUMS",
        "InstallDir": "/opt/acme/bin",
        "IncludePrereleases": false,
        "ConnectTimeoutSec": 5,
        "TimeoutSec": 60,
        "UserAgent": "acme-installer",
        "LogLevel": "debug",
        "RestartDaemon": false
    })", cfg);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(cfg.api_base, "https://ghe.example.test/api/v3");
    EXPECT_EQ(cfg.repository, "acme/daemon");
    EXPECT_EQ(cfg.EffectiveDownloadBase(), "https://mirror.example.test/releases");
    EXPECT_EQ(cfg.binary_name, "acme-daemon");
    EXPECT_EQ(cfg.asset_template, "{name}-{tag}-{target}.{ext}");
    EXPECT_EQ(cfg.checksums_name, "SHA256SUMS");
    EXPECT_EQ(cfg.install_dir, "/opt/acme/bin");
    EXPECT_FALSE(cfg.include_prereleases);
    EXPECT_EQ(cfg.connect_timeout_sec, 5);
    EXPECT_EQ(cfg.timeout_sec, 60);
    EXPECT_EQ(cfg.user_agent, "acme-installer");
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_FALSE(cfg.restart_daemon);
}

TEST(InstallerConfigTest, MissingKeysKeepDefaults) {
    InstallerConfig cfg;
    ASSERT_TRUE(InstallerConfig::LoadFromString(R"({"Repository": "acme/daemon"})", cfg).is_ok());
    EXPECT_EQ(cfg.binary_name, "centy-daemon");
    EXPECT_EQ(cfg.EffectiveDownloadBase(), "https://github.com/acme/daemon/releases/download");
}

TEST(InstallerConfigTest, WrongTypeIsRejectedAndLeavesConfigUntouched) {
    InstallerConfig cfg;
    auto r = InstallerConfig::LoadFromString(R"({"Repository": "acme/daemon", "TimeoutSec": "60"})", cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("TimeoutSec"), std::string::npos);
    EXPECT_EQ(cfg.repository, "centy-io/centy-daemon");
}

TEST(InstallerConfigTest, RejectsBadValues) {
    InstallerConfig cfg;
    EXPECT_FALSE(InstallerConfig::LoadFromString(R"({"LogLevel": "chatty"})", cfg).is_ok());
    EXPECT_FALSE(InstallerConfig::LoadFromString(R"({"BinaryName": ""})", cfg).is_ok());
    EXPECT_FALSE(InstallerConfig::LoadFromString(R"({"ConnectTimeoutSec": -1})", cfg).is_ok());
    EXPECT_FALSE(InstallerConfig::LoadFromString(R"(["not", "an", "object"])", cfg).is_ok());
    EXPECT_FALSE(InstallerConfig::LoadFromString("{broken", cfg).is_ok());
}

TEST(InstallerConfigTest, LoadFromFileReportsPath) {
    InstallerConfig cfg;
    auto r = InstallerConfig::LoadFromFile("/nonexistent/centy/installer.json", cfg);
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("/nonexistent/centy/installer.json"), std::string::npos);
}

TEST(LoadInstallerConfigTest, ExplicitPathWins) {
    testutil::TemporaryDirectory tmp;
    const std::string explicit_path = tmp.Path() + "/explicit.json";
    const std::string env_path = tmp.Path() + "/env.json";
    testutil::WriteFile(explicit_path, R"({"BinaryName": "from-explicit"})");
    testutil::WriteFile(env_path, R"({"BinaryName": "from-env"})");
    ScopedEnv env(kConfigEnvVar, env_path);

    InstallerConfig cfg;
    ASSERT_TRUE(LoadInstallerConfig(explicit_path, cfg).is_ok());
    EXPECT_EQ(cfg.binary_name, "from-explicit");
}

TEST(LoadInstallerConfigTest, EnvironmentVariableIsUsed) {
    testutil::TemporaryDirectory tmp;
    const std::string env_path = tmp.Path() + "/env.json";
    testutil::WriteFile(env_path, R"({"BinaryName": "from-env"})");
    ScopedEnv env(kConfigEnvVar, env_path);

    InstallerConfig cfg;
    ASSERT_TRUE(LoadInstallerConfig(std::nullopt, cfg).is_ok());
    EXPECT_EQ(cfg.binary_name, "from-env");
}

TEST(LoadInstallerConfigTest, MissingDefaultFileIsFine) {
    testutil::TemporaryDirectory tmp;
    ScopedEnv env(kConfigEnvVar, "");
    ScopedEnv home("HOME", tmp.Path());

    InstallerConfig cfg;
    ASSERT_TRUE(LoadInstallerConfig(std::nullopt, cfg).is_ok());
    EXPECT_EQ(cfg.binary_name, "centy-daemon");
}

TEST(LoadInstallerConfigTest, DefaultFileUnderHomeIsRead) {
    testutil::TemporaryDirectory tmp;
    std::filesystem::create_directories(tmp.Path() + "/.centy");
    testutil::WriteFile(tmp.Path() + "/.centy/installer.json", R"({"RestartDaemon": false})");
    ScopedEnv env(kConfigEnvVar, "");
    ScopedEnv home("HOME", tmp.Path());

    InstallerConfig cfg;
    ASSERT_TRUE(LoadInstallerConfig(std::nullopt, cfg).is_ok());
    EXPECT_FALSE(cfg.restart_daemon);
}

TEST(LoadInstallerConfigTest, MissingExplicitFileFails) {
    InstallerConfig cfg;
    EXPECT_FALSE(LoadInstallerConfig(std::string("/nonexistent/installer.json"), cfg).is_ok());
}

TEST(ParseLogLevelTest, AcceptsKnownNames) {
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::None);
    EXPECT_FALSE(ParseLogLevel("loud").has_value());
}

} // namespace centy
