#pragma once

#include "util/result.hpp"

namespace centy {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    // Gives up ownership without closing.
    int Release();
    // close(2) errors surface here; the destructor ignores them.
    Result Close();

  private:
    int fd_{-1};
};

} // namespace centy
