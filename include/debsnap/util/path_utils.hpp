#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

namespace debsnap {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Drop trailing slashes but keep "/" itself.
inline std::string TrimTrailingSlashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

// Absolute, lexically normalized form with symlinks resolved for the part
// that exists.
inline std::filesystem::path NormalizedAbsolute(const std::filesystem::path& p) {
    std::error_code ec;
    auto out = std::filesystem::weakly_canonical(p, ec);
    if (ec) out = std::filesystem::absolute(p, ec).lexically_normal();
    return std::filesystem::path(TrimTrailingSlashes(out.string()));
}

// True when `child` equals `parent` or lies below it.
inline bool IsSameOrWithin(const std::filesystem::path& child, const std::filesystem::path& parent) {
    const std::string c = NormalizedAbsolute(child).string();
    const std::string p = NormalizedAbsolute(parent).string();
    if (c == p) return true;
    if (p == "/") return true;
    return StartsWith(c, p) && c.size() > p.size() && c[p.size()] == '/';
}

// `path` expressed relative to `base`, e.g. "pool/a_1.0_amd64.deb".
inline std::string RelativePathString(const std::filesystem::path& path,
                                      const std::filesystem::path& base) {
    return NormalizedAbsolute(path).lexically_relative(NormalizedAbsolute(base)).generic_string();
}

// 20250101T120000Z
inline std::string UtcStamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

} // namespace debsnap
