#include "dirspec/platform/platform.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace dirspec::platform {

std::string_view platform_name(Platform platform) {
    switch (platform) {
    case Platform::Linux: return "linux";
    case Platform::MacOS: return "macos";
    case Platform::Windows: return "windows";
    }
    return "unknown";
}

std::optional<Platform> parse_platform(std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "linux") return Platform::Linux;
    if (lower == "macos" || lower == "darwin") return Platform::MacOS;
    if (lower == "windows" || lower == "win32") return Platform::Windows;
    return std::nullopt;
}

static bool is_windows_separator(char c) {
    return c == '\\' || c == '/';
}

bool is_absolute(std::string_view path, Platform platform) {
    if (path.empty()) return false;

    if (platform != Platform::Windows) return path.front() == '/';

    // \\server\share or //server/share
    if (path.size() >= 2 && is_windows_separator(path[0]) && is_windows_separator(path[1]))
        return true;

    // C:\ or C:/ (a bare "C:" or "C:foo" is drive-relative)
    return path.size() >= 3
        && std::isalpha(static_cast<unsigned char>(path[0]))
        && path[1] == ':'
        && is_windows_separator(path[2]);
}

std::filesystem::path join(std::string_view base, std::string_view sub, Platform platform) {
    if (sub.empty()) return std::filesystem::path(base);

    const char sep = platform == Platform::Windows ? '\\' : '/';

    std::string out(base);
    bool trailing = !out.empty()
        && (out.back() == sep || (platform == Platform::Windows && out.back() == '/'));
    if (!out.empty() && !trailing) out.push_back(sep);

    for (char c : sub) {
        out.push_back(c == '/' ? sep : c);
    }
    return std::filesystem::path(out);
}

} // namespace dirspec::platform
