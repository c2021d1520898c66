#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace centy {

// $HOME, falling back to the passwd entry of the current user.
std::expected<std::filesystem::path, std::string> ResolveHomeDir();

} // namespace centy
