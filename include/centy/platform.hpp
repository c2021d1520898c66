#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace centy {

enum class Os { MacOs, Linux, Windows };
enum class Arch { X86_64, Aarch64 };
enum class ArchiveKind { TarGz, Zip };

struct Platform {
    Os os = Os::Linux;
    Arch arch = Arch::X86_64;

    bool operator==(const Platform&) const = default;
};

// Raw host identifiers as reported by the OS (uname sysname/machine).
struct HostInfo {
    std::string os;
    std::string arch;
};

HostInfo ProbeHost();

// Maps raw identifiers to a supported Platform. Aliases such as "amd64" and
// "arm64" are normalized; unsupported pairs are an error, never coerced.
std::expected<Platform, std::string> DetectPlatform(const HostInfo& host);

std::string_view TargetTriple(const Platform& p);
ArchiveKind ArchiveKindFor(Os os);
std::string_view ArchiveExtension(ArchiveKind kind);

// "name" on Unix targets, "name.exe" on Windows.
std::string ExecutableName(std::string_view base_name, Os os);

} // namespace centy
