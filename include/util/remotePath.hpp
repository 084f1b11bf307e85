#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Remote paths are '/'-separated, relative, with no leading or trailing separator.

namespace rfs::util {

inline constexpr std::string_view INVALID_PATH_CHARS = "*?|<>:";

inline std::vector<std::string> pathSegments(const std::string_view path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        const auto end = std::min(path.find('/', start), path.size());
        const auto seg = path.substr(start, end - start);
        if (!seg.empty() && seg != ".") segments.emplace_back(seg);
        start = end + 1;
    }
    return segments;
}

inline std::string joinSegments(const std::vector<std::string>& segments, const size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < segments.size(); ++i) {
        if (i) out += '/';
        out += segments[i];
    }
    return out;
}

inline std::string joinSegments(const std::vector<std::string>& segments) {
    return joinSegments(segments, segments.size());
}

inline std::string joinPath(const std::string& dir, const std::string& leaf) {
    if (dir.empty()) return leaf;
    if (leaf.empty()) return dir;
    return dir + "/" + leaf;
}

inline bool isRootPath(const std::string_view path) {
    return path.empty() || path == "/" || path == ".";
}

/// Lexically normalises a user supplied path: empty and "." segments are
/// dropped, ".." pops its parent, separators are trimmed.
/// Throws std::invalid_argument for characters the remote can't store.
inline std::string cleanPath(const std::string_view path) {
    if (path.find_first_of(INVALID_PATH_CHARS) != std::string_view::npos)
        throw std::invalid_argument("path contains invalid characters: " + std::string(path));

    std::vector<std::string> out;
    for (auto& seg : pathSegments(path)) {
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(std::move(seg));
    }
    return joinSegments(out);
}

/// "a/b/c" -> {"a/b", "c"}, "c" -> {"", "c"}
inline std::pair<std::string, std::string> splitPath(const std::string_view path) {
    auto p = path;
    while (!p.empty() && p.front() == '/') p.remove_prefix(1);
    while (!p.empty() && p.back() == '/') p.remove_suffix(1);

    const auto i = p.rfind('/');
    if (i == std::string_view::npos) return {"", std::string(p)};
    return {std::string(p.substr(0, i)), std::string(p.substr(i + 1))};
}

}
