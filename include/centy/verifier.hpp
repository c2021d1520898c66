#pragma once

#include "centy/checksum_manifest.hpp"
#include "centy/downloader.hpp"
#include "util/result.hpp"

#include <string>

namespace centy {

class ArtifactVerifier {
public:
    // Fails when the manifest has no usable entry for `archive_filename` or the
    // SHA-256 of the artifact bytes differs from it (hex case ignored).
    Result Verify(const DownloadedArtifact& artifact,
                  const ChecksumManifest& manifest,
                  const std::string& archive_filename) const;
};

} // namespace centy
