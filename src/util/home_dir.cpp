#include "util/home_dir.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace centy {

std::expected<std::filesystem::path, std::string> ResolveHomeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return std::filesystem::path(home);

    struct passwd pw{};
    struct passwd* result = nullptr;
    std::vector<char> buf(16 * 1024);
    if (::getpwuid_r(::getuid(), &pw, buf.data(), buf.size(), &result) == 0 && result &&
        result->pw_dir && *result->pw_dir) {
        return std::filesystem::path(result->pw_dir);
    }
    return std::unexpected("could not determine home directory");
}

} // namespace centy
