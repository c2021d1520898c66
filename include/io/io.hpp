#pragma once

#include <cstdint>
#include <span>
#include <sys/types.h>

namespace centy {

class IReader {
public:
    virtual ~IReader() = default;
    // Returns bytes read, 0 on end of stream, -1 on error.
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
};

} // namespace centy
