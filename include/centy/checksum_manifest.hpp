#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace centy {

// Filename -> expected SHA-256 hex digest, parsed from "<hex>  <filename>" lines.
class ChecksumManifest {
public:
    static ChecksumManifest Parse(std::string_view text);

    std::optional<std::string> Find(std::string_view filename) const;
    std::size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace centy
