#include "centy/checksum_manifest.hpp"

namespace centy {

namespace {

constexpr std::string_view kSpace = " \t\r";

} // namespace

ChecksumManifest ChecksumManifest::Parse(std::string_view text) {
    ChecksumManifest out;

    while (!text.empty()) {
        const auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

        const auto start = line.find_first_not_of(kSpace);
        if (start == std::string_view::npos) continue;
        line.remove_prefix(start);

        const auto sep = line.find_first_of(kSpace);
        if (sep == std::string_view::npos) continue;
        const std::string_view digest = line.substr(0, sep);

        std::string_view name = line.substr(sep);
        const auto name_start = name.find_first_not_of(kSpace);
        if (name_start == std::string_view::npos) continue;
        name.remove_prefix(name_start);
        name = name.substr(0, name.find_last_not_of(kSpace) + 1);
        // sha256sum marks binary-mode entries with '*'
        if (!name.empty() && name.front() == '*') name.remove_prefix(1);
        if (name.empty()) continue;

        out.entries_.emplace(std::string(name), std::string(digest));
    }

    return out;
}

std::optional<std::string> ChecksumManifest::Find(std::string_view filename) const {
    auto it = entries_.find(std::string(filename));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace centy
