#pragma once

#include "util/result.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace centy {

bool IsProcessRunning(pid_t pid);

// Restarts an already running daemon so it picks up a freshly installed binary.
class DaemonControl {
public:
    struct Options {
        std::filesystem::path pid_file;
        std::string process_name = "centy-daemon";
        std::chrono::milliseconds poll_interval{500};
        int graceful_polls = 10;
    };

    explicit DaemonControl(Options opt) : opt_(std::move(opt)) {}

    // Pid file first (ignored when unreadable or stale), then `pgrep -x`.
    std::optional<pid_t> FindRunningPid() const;

    // true if a daemon was found and restarted, false if none was running.
    std::expected<bool, std::string> RestartIfRunning(const std::filesystem::path& binary) const;

    Result Stop(pid_t pid) const;
    Result Start(const std::filesystem::path& binary) const;

private:
    std::optional<pid_t> ReadPidFile() const;
    std::optional<pid_t> FindPidByName() const;

    Options opt_;
};

// pid file <home>/.centy/daemon.pid, process name = binary name.
DaemonControl::Options DaemonOptionsFor(const std::filesystem::path& home, std::string process_name);

} // namespace centy
