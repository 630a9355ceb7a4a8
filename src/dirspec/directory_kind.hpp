#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace dirspec {

enum class DirectoryKind {
    Home,
    BinHome,
    CacheHome,
    ConfigHome,
    ConfigLocal,
    DataHome,
    DataLocal,
    StateHome,
    Desktop,
    Documents,
    Downloads,
    Music,
    Pictures,
    Videos,
    Templates,
    PublicShare,
    Runtime,
    Fonts,
    Preferences,
};

inline constexpr size_t directory_kind_count = 19;

// Every kind, in declaration order.
const std::array<DirectoryKind, directory_kind_count>& all_directory_kinds();

// snake_case name, e.g. "config_home", "publicshare".
std::string_view directory_kind_name(DirectoryKind kind);

// Inverse of directory_kind_name; '-' is accepted in place of '_'.
std::optional<DirectoryKind> parse_directory_kind(std::string_view name);

// XDG variable that overrides `kind`, if one is assigned.
std::optional<std::string_view> xdg_variable(DirectoryKind kind);

} // namespace dirspec
