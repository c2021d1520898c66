#pragma once

#include "centy/platform.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace centy {

struct ExtractedBinary {
    std::vector<std::uint8_t> bytes;
    std::optional<std::uint32_t> mode; // permission bits recorded in the archive, if any
    std::string entry_path;
};

// Pulls exactly one regular file whose base name equals `binary_name` out of a
// tar.gz or zip archive held in memory. Zero or several matches fail.
class ArchiveExtractor {
public:
    struct Options {
        std::uint64_t max_entry_bytes = 1ULL << 30;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result Extract(std::span<const std::uint8_t> archive_bytes,
                   ArchiveKind kind,
                   std::string_view binary_name,
                   ExtractedBinary& out) const;

private:
    Options opt_{};
};

} // namespace centy
