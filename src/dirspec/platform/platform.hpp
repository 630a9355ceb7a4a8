#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace dirspec::platform {

enum class Platform {
    Linux,
    MacOS,
    Windows,
};

// The platform this library was compiled for.
constexpr Platform host_platform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

std::string_view platform_name(Platform platform);
std::optional<Platform> parse_platform(std::string_view name);

// Absoluteness under the rules of `platform`, independent of the host.
// Unix: leading '/'. Windows: "C:\", "C:/", or a UNC prefix.
bool is_absolute(std::string_view path, Platform platform);

// Join `sub` (written with '/' separators) onto `base` using the
// platform's separator.
std::filesystem::path join(std::string_view base, std::string_view sub, Platform platform);

} // namespace dirspec::platform
