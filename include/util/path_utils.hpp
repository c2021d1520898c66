#pragma once

#include <string>
#include <string_view>

namespace centy {

// Normalize an archive entry path to a clean relative form:
// - backslashes become '/' (zip archives written on Windows)
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Last path segment; "dir/sub/tool" -> "tool", "dir/" -> "".
inline std::string_view EntryBaseName(std::string_view path) {
    const auto pos = path.rfind('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

} // namespace centy
