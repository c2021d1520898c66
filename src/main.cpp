#include "centy/daemon_control.hpp"
#include "centy/pipeline.hpp"
#include "centy/progress_sinks.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/home_dir.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [--no-restart] [-v] [version]\n"
        "\n"
        "Installs the centy daemon binary for this machine. Without a version\n"
        "the newest published release is installed.\n"
        "\n"
        "Release assets are named by the AssetTemplate config key\n"
        "(default \"{name}-{target}.{ext}\"). Releases that embed the tag, such as\n"
        "centy-daemon-v0.2.0-aarch64-apple-darwin.tar.gz, need\n"
        "\"AssetTemplate\": \"{name}-{tag}-{target}.{ext}\".\n"
        "\n"
        "Options:\n"
        "  -c, --config       Config file (default $CENTY_INSTALLER_CONFIG or ~/.centy/installer.json)\n"
        "      --no-restart   Do not restart a running daemon after install\n"
        "  -v, --verbose      Debug logging\n"
        "  -h, --help         Show this help\n",
        argv);
}

constexpr int kOptNoRestart = 1000;

} // namespace

int main(int argc, char **argv) {
    centy::InstallSignalHandlers();

    std::optional<std::string> config_path;
    std::optional<std::string> version;
    bool no_restart = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"no-restart", no_argument, nullptr, kOptNoRestart},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            case kOptNoRestart:
                no_restart = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (argc - optind > 1) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (optind < argc) {
        version = argv[optind];
    }

    centy::InstallerConfig cfg;
    if (auto r = centy::LoadInstallerConfig(config_path, cfg); !r.ok) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.msg.c_str());
        return 2;
    }
    centy::Logger::Instance().SetLevel(verbose ? centy::LogLevel::Debug : cfg.log_level);

    centy::ConsoleProgressSink progress;
    auto installed = centy::InstallBinary(version, cfg, &progress);
    centy::RestoreDefaultSignalHandlers();
    centy::ClearProgressLine();
    if (!installed) {
        std::fprintf(stderr, "ERROR: %s\n", installed.error().Describe().c_str());
        return 1;
    }

    std::printf("%s\n", installed->c_str());

    if (cfg.restart_daemon && !no_restart) {
        auto home = centy::ResolveHomeDir();
        if (!home) {
            LogWarn("daemon not restarted: %s", home.error().c_str());
            return 0;
        }
        centy::DaemonControl daemon(centy::DaemonOptionsFor(*home, cfg.binary_name));
        auto restarted = daemon.RestartIfRunning(*installed);
        if (!restarted) {
            LogWarn("daemon not restarted: %s", restarted.error().c_str());
        } else if (*restarted) {
            LogInfo("Daemon restarted with the new binary");
        }
    }

    return 0;
}
