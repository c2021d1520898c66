#include "centy/daemon_control.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <charconv>
#include <climits>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace centy {

namespace {

std::optional<pid_t> ParsePid(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return std::nullopt;
    s.remove_prefix(first);
    s = s.substr(0, s.find_last_not_of(" \t\r\n") + 1);

    long long v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    if (v <= 0 || v > INT_MAX) return std::nullopt;
    return static_cast<pid_t>(v);
}

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

struct PipeCloser {
    void operator()(FILE* f) const {
        if (f) (void)::pclose(f);
    }
};

} // namespace

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

std::optional<pid_t> DaemonControl::ReadPidFile() const {
    if (opt_.pid_file.empty()) return std::nullopt;
    std::ifstream is(opt_.pid_file);
    if (!is.good()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());

    const auto pid = ParsePid(content);
    if (!pid) {
        LogDebug("ignoring unparsable pid file %s", opt_.pid_file.c_str());
        return std::nullopt;
    }
    if (!IsProcessRunning(*pid)) {
        LogDebug("ignoring stale pid file %s (pid %d)", opt_.pid_file.c_str(), (int)*pid);
        return std::nullopt;
    }
    return pid;
}

std::optional<pid_t> DaemonControl::FindPidByName() const {
    if (opt_.process_name.empty()) return std::nullopt;
    const std::string cmd = "pgrep -x " + ShellQuote(opt_.process_name) + " 2>/dev/null";
    std::unique_ptr<FILE, PipeCloser> pipe(::popen(cmd.c_str(), "r"));
    if (!pipe) return std::nullopt;

    char line[64]{};
    while (std::fgets(line, sizeof(line), pipe.get()) != nullptr) {
        const auto pid = ParsePid(line);
        if (pid && *pid != ::getpid()) return pid;
    }
    return std::nullopt;
}

std::optional<pid_t> DaemonControl::FindRunningPid() const {
    if (auto pid = ReadPidFile()) return pid;
    return FindPidByName();
}

Result DaemonControl::Stop(pid_t pid) const {
    if (::kill(pid, SIGTERM) != 0) {
        const int err = errno;
        if (err == ESRCH) return Result::Ok();
        return Result::Fail(err, "failed to send SIGTERM to daemon (PID " + std::to_string(pid) +
                                     "): " + std::strerror(err));
    }

    for (int i = 0; i < opt_.graceful_polls; ++i) {
        std::this_thread::sleep_for(opt_.poll_interval);
        if (!IsProcessRunning(pid)) return Result::Ok();
    }

    LogWarn("daemon (PID %d) ignored SIGTERM, sending SIGKILL", (int)pid);
    (void)::kill(pid, SIGKILL);
    std::this_thread::sleep_for(opt_.poll_interval);

    if (IsProcessRunning(pid)) {
        return Result::Fail(-1, "failed to stop daemon (PID " + std::to_string(pid) + ") after forced kill");
    }
    return Result::Ok();
}

Result DaemonControl::Start(const fs::path& binary) const {
    // exec failure is reported back through a close-on-exec pipe.
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, std::string("pipe failed: ") + std::strerror(err));
    }
    Fd rd(fds[0]);
    Fd wr(fds[1]);

    const pid_t child = ::fork();
    if (child < 0) {
        const int err = errno;
        return Result::Fail(err, std::string("failed to start daemon: fork: ") + std::strerror(err));
    }

    if (child == 0) {
        ::setsid();
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execl(binary.c_str(), binary.c_str(), static_cast<char*>(nullptr));
        const int err = errno;
        (void)!::write(wr.Get(), &err, sizeof(err));
        ::_exit(127);
    }

    (void)wr.Close();
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(rd.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)::waitpid(child, nullptr, 0);
        return Result::Fail(child_errno, "failed to start daemon " + binary.string() + ": " +
                                             std::strerror(child_errno));
    }

    LogInfo("Started daemon %s (PID %d)", binary.c_str(), (int)child);
    return Result::Ok();
}

std::expected<bool, std::string> DaemonControl::RestartIfRunning(const fs::path& binary) const {
    const auto pid = FindRunningPid();
    if (!pid) {
        LogDebug("daemon not running, nothing to restart");
        return false;
    }

    LogInfo("Restarting daemon (PID %d)", (int)*pid);
    auto sr = Stop(*pid);
    if (!sr.is_ok()) return std::unexpected(sr.msg);

    auto st = Start(binary);
    if (!st.is_ok()) return std::unexpected(st.msg);
    return true;
}

DaemonControl::Options DaemonOptionsFor(const fs::path& home, std::string process_name) {
    DaemonControl::Options opt;
    opt.pid_file = home / ".centy" / "daemon.pid";
    opt.process_name = std::move(process_name);
    return opt;
}

} // namespace centy
