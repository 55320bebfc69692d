#pragma once

#include <string>
#include <string_view>

namespace piprov {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

// "/dev/sdb" -> "sdb", "https://host/a/b.img.xz" -> "b.img.xz"
inline std::string LastPathComponent(std::string_view s) {
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    const auto pos = s.rfind('/');
    return std::string(pos == std::string_view::npos ? s : s.substr(pos + 1));
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Joins a URL or filesystem base with one relative component.
inline std::string JoinPath(std::string_view base, std::string_view leaf) {
    std::string out(base);
    if (!out.empty() && out.back() != '/') out.push_back('/');
    while (!leaf.empty() && leaf.front() == '/') leaf.remove_prefix(1);
    out.append(leaf);
    return out;
}

} // namespace piprov
