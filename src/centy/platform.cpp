#include "centy/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sys/utsname.h>

namespace centy {

namespace {

std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<Os> ParseOs(std::string_view raw) {
    const std::string s = Lower(raw);
    if (s == "darwin" || s == "macos" || s == "osx") return Os::MacOs;
    if (s == "linux") return Os::Linux;
    if (s == "windows" || s == "windows_nt" || s.rfind("mingw", 0) == 0 || s.rfind("msys", 0) == 0 ||
        s.rfind("cygwin", 0) == 0) {
        return Os::Windows;
    }
    return std::nullopt;
}

std::optional<Arch> ParseArch(std::string_view raw) {
    const std::string s = Lower(raw);
    if (s == "x86_64" || s == "amd64" || s == "x64") return Arch::X86_64;
    if (s == "aarch64" || s == "arm64") return Arch::Aarch64;
    return std::nullopt;
}

} // namespace

HostInfo ProbeHost() {
    HostInfo host;
    struct utsname u{};
    if (::uname(&u) == 0) {
        host.os = u.sysname;
        host.arch = u.machine;
    }
    return host;
}

std::expected<Platform, std::string> DetectPlatform(const HostInfo& host) {
    const auto os = ParseOs(host.os);
    const auto arch = ParseArch(host.arch);
    const std::string label = (host.os.empty() ? "unknown" : host.os) + "-" +
                              (host.arch.empty() ? "unknown" : host.arch);
    if (!os) return std::unexpected("unsupported operating system: " + label);
    if (!arch) return std::unexpected("unsupported architecture: " + label);

    // Windows on ARM has no published build.
    if (*os == Os::Windows && *arch == Arch::Aarch64) {
        return std::unexpected("unsupported platform: " + label);
    }
    return Platform{.os = *os, .arch = *arch};
}

std::string_view TargetTriple(const Platform& p) {
    switch (p.os) {
        case Os::MacOs:
            return p.arch == Arch::Aarch64 ? "aarch64-apple-darwin" : "x86_64-apple-darwin";
        case Os::Linux:
            return p.arch == Arch::Aarch64 ? "aarch64-unknown-linux-gnu" : "x86_64-unknown-linux-gnu";
        case Os::Windows:
            return "x86_64-pc-windows-msvc";
    }
    return {};
}

ArchiveKind ArchiveKindFor(Os os) {
    return os == Os::Windows ? ArchiveKind::Zip : ArchiveKind::TarGz;
}

std::string_view ArchiveExtension(ArchiveKind kind) {
    return kind == ArchiveKind::Zip ? "zip" : "tar.gz";
}

std::string ExecutableName(std::string_view base_name, Os os) {
    std::string name(base_name);
    if (os == Os::Windows) name += ".exe";
    return name;
}

} // namespace centy
