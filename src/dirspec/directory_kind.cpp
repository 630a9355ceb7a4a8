#include "dirspec/directory_kind.hpp"

#include <algorithm>
#include <string>

namespace dirspec {

namespace {

struct KindInfo {
    DirectoryKind kind;
    std::string_view name;
    std::string_view xdg_var; // empty when the kind has no override
};

constexpr std::array<KindInfo, directory_kind_count> kinds = {{
    {DirectoryKind::Home,        "home",         ""},
    {DirectoryKind::BinHome,     "bin_home",     "XDG_BIN_HOME"},
    {DirectoryKind::CacheHome,   "cache_home",   "XDG_CACHE_HOME"},
    {DirectoryKind::ConfigHome,  "config_home",  "XDG_CONFIG_HOME"},
    {DirectoryKind::ConfigLocal, "config_local", ""},
    {DirectoryKind::DataHome,    "data_home",    "XDG_DATA_HOME"},
    {DirectoryKind::DataLocal,   "data_local",   ""},
    {DirectoryKind::StateHome,   "state_home",   "XDG_STATE_HOME"},
    {DirectoryKind::Desktop,     "desktop",      "XDG_DESKTOP_DIR"},
    {DirectoryKind::Documents,   "documents",    "XDG_DOCUMENTS_DIR"},
    {DirectoryKind::Downloads,   "downloads",    "XDG_DOWNLOAD_DIR"},
    {DirectoryKind::Music,       "music",        "XDG_MUSIC_DIR"},
    {DirectoryKind::Pictures,    "pictures",     "XDG_PICTURES_DIR"},
    {DirectoryKind::Videos,      "videos",       "XDG_VIDEOS_DIR"},
    {DirectoryKind::Templates,   "templates",    "XDG_TEMPLATES_DIR"},
    {DirectoryKind::PublicShare, "publicshare",  "XDG_PUBLICSHARE_DIR"},
    {DirectoryKind::Runtime,     "runtime",      "XDG_RUNTIME_DIR"},
    {DirectoryKind::Fonts,       "fonts",        ""},
    {DirectoryKind::Preferences, "preferences",  ""},
}};

const KindInfo& info(DirectoryKind kind) {
    return kinds[static_cast<size_t>(kind)];
}

} // namespace

const std::array<DirectoryKind, directory_kind_count>& all_directory_kinds() {
    static const auto all = [] {
        std::array<DirectoryKind, directory_kind_count> out{};
        std::ranges::transform(kinds, out.begin(), &KindInfo::kind);
        return out;
    }();
    return all;
}

std::string_view directory_kind_name(DirectoryKind kind) {
    return info(kind).name;
}

std::optional<DirectoryKind> parse_directory_kind(std::string_view name) {
    std::string normalized(name);
    std::ranges::replace(normalized, '-', '_');

    auto it = std::ranges::find(kinds, std::string_view(normalized), &KindInfo::name);
    if (it == kinds.end()) return std::nullopt;
    return it->kind;
}

std::optional<std::string_view> xdg_variable(DirectoryKind kind) {
    auto var = info(kind).xdg_var;
    if (var.empty()) return std::nullopt;
    return var;
}

} // namespace dirspec
