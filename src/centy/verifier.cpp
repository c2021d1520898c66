#include "centy/verifier.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <span>

namespace centy {

namespace {

constexpr size_t kSha256HexLen = 64;
constexpr size_t kChunk = 64 * 1024;

std::string NormalizeHex(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool IsSha256Hex(const std::string& s) {
    return s.size() == kSha256HexLen &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

Result ArtifactVerifier::Verify(const DownloadedArtifact& artifact,
                                const ChecksumManifest& manifest,
                                const std::string& archive_filename) const {
    const auto entry = manifest.Find(archive_filename);
    if (!entry) {
        return Result::Fail(-1, "checksum not found for " + archive_filename + " in checksum manifest");
    }

    const std::string expected = NormalizeHex(*entry);
    if (!IsSha256Hex(expected)) {
        return Result::Fail(-1, "malformed sha256 for " + archive_filename + " in checksum manifest: " + *entry);
    }

    Sha256Hasher hasher;
    const std::span<const std::uint8_t> bytes(artifact.bytes);
    for (size_t off = 0; off < bytes.size(); off += kChunk) {
        hasher.Update(bytes.subspan(off, std::min(kChunk, bytes.size() - off)));
    }
    const std::string actual = hasher.FinalHex();
    if (actual.empty()) {
        return Result::Fail(-1, "sha256 compute failed");
    }

    if (actual != expected) {
        return Result::Fail(-1,
                            "sha256 mismatch for " + archive_filename + ": expected=" + expected +
                                " actual=" + actual);
    }

    LogDebug("sha256 ok for %s: %s", archive_filename.c_str(), actual.c_str());
    return Result::Ok();
}

} // namespace centy
