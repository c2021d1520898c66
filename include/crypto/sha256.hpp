#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace centy {

// Lowercase hex digest, or an empty string if OpenSSL fails.
std::string Sha256Hex(std::span<const std::uint8_t> data);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace centy
