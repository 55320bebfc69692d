#pragma once

#include <algorithm>
#include <cstdint>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace piprov {

inline std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

inline std::string Trim(std::string_view s) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}

inline std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        const size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            std::string_view last = text.substr(start);
            if (!last.empty() && last.back() == '\r') last.remove_suffix(1);
            if (!last.empty()) lines.emplace_back(last);
            break;
        }
        std::string_view line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        start = nl + 1;
    }
    return lines;
}

inline std::string FirstToken(std::string_view s) {
    const std::string trimmed = Trim(s);
    const auto end = std::find_if(trimmed.begin(), trimmed.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    return std::string(trimmed.begin(), end);
}

// Literal text for use inside a std::regex (ECMAScript grammar).
inline std::string EscapeRegex(std::string_view s) {
    constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (kSpecial.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// 1536 -> "1.5 KiB"; used for operator-facing sizes only.
std::string HumanSize(std::uint64_t bytes);

} // namespace piprov
