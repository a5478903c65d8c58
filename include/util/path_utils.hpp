#pragma once

#include <string>
#include <string_view>

namespace geoupdate {

// Last element of a '/'-separated path, trailing slashes ignored.
// "" -> ".", "/" -> "/", "a/b/" -> "b".
inline std::string PathBase(std::string_view s) {
    if (s.empty()) return ".";
    while (s.size() > 1 && s.back() == '/') s.remove_suffix(1);
    if (s == "/") return "/";
    const size_t slash = s.rfind('/');
    if (slash != std::string_view::npos) s.remove_prefix(slash + 1);
    return std::string(s);
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty()) return std::string(name);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    out.append(name);
    return out;
}

} // namespace geoupdate
