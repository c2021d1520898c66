#include "centy/binary_installer.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <span>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace centy {

namespace {

std::string ErrnoMsg(const std::string& what, const std::string& path, int err) {
    return what + " " + path + ": " + std::strerror(err);
}

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data, const std::string& path) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, ErrnoMsg("write failed:", path, err));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

void SyncDirectory(const fs::path& dir) {
    Fd dfd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
    if (!dfd.Valid() || ::fsync(dfd.Get()) != 0) {
        LogDebug("directory fsync skipped for %s: %s", dir.c_str(), std::strerror(errno));
    }
}

} // namespace

Result TempFile::CreateIn(const fs::path& dir, const std::string& stem, TempFile& out) {
    std::string tmpl = (dir / ("." + stem + ".tmp-XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, ErrnoMsg("mkstemp failed in", dir.string(), err));
    }
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::Close() { return fd_.Close(); }

void TempFile::Commit() { path_.clear(); }

void TempFile::Cleanup() {
    (void)fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result BinaryInstaller::Install(const ExtractedBinary& binary,
                                const fs::path& destination,
                                InstalledBinary& out) const {
    if (destination.empty() || !destination.has_filename()) {
        return Result::Fail(-1, "invalid install destination: " + destination.string());
    }
    if (binary.bytes.empty()) {
        return Result::Fail(-1, "refusing to install an empty binary to " + destination.string());
    }

    const fs::path dir = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "failed to create " + dir.string() + ": " + ec.message());
    }

    TempFile tmp;
    auto cr = TempFile::CreateIn(dir, destination.filename().string(), tmp);
    if (!cr.is_ok()) return cr;

    auto wr = WriteAllToFd(tmp.GetFd(), binary.bytes, tmp.Path());
    if (!wr.is_ok()) return wr;

    // Archive mode bits are informational only.
    if (::fchmod(tmp.GetFd(), kExecutableMode) != 0) {
        const int err = errno;
        return Result::Fail(err, ErrnoMsg("chmod failed:", tmp.Path(), err));
    }
    if (::fsync(tmp.GetFd()) != 0) {
        const int err = errno;
        return Result::Fail(err, ErrnoMsg("fsync failed:", tmp.Path(), err));
    }
    auto close_res = tmp.Close();
    if (!close_res.is_ok()) return close_res;

    if (::rename(tmp.Path().c_str(), destination.c_str()) != 0) {
        const int err = errno;
        return Result::Fail(err,
                            "Atomic rename failed: " + tmp.Path() + " -> " + destination.string() + ": " +
                                std::strerror(err));
    }
    tmp.Commit();
    SyncDirectory(dir);

    out.path = destination;
    out.mode = kExecutableMode;
    LogInfo("Installed %s (%zu bytes)", destination.c_str(), binary.bytes.size());
    return Result::Ok();
}

fs::path InstallDirFor(const fs::path& home) {
    return home / ".centy" / "bin";
}

} // namespace centy
