#pragma once

#include "centy/archive_extractor.hpp"
#include "io/fd.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace centy {

// mkstemp-backed file that is unlinked on destruction unless committed.
class TempFile {
public:
    // Creates "<dir>/.<stem>.tmp-XXXXXX".
    static Result CreateIn(const std::filesystem::path& dir, const std::string& stem, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    Result Close();
    // The path now belongs to someone else (e.g. renamed away); do not unlink it.
    void Commit();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

struct InstalledBinary {
    std::filesystem::path path;
    std::uint32_t mode = 0;
};

class BinaryInstaller {
public:
    static constexpr std::uint32_t kExecutableMode = 0755;

    // Writes to a temp file beside `destination`, sets 0755 regardless of any
    // archive mode, fsyncs, then renames over `destination`. Missing parent
    // directories are created. On failure `destination` is left untouched.
    Result Install(const ExtractedBinary& binary,
                   const std::filesystem::path& destination,
                   InstalledBinary& out) const;
};

// <home>/.centy/bin
std::filesystem::path InstallDirFor(const std::filesystem::path& home);

} // namespace centy
