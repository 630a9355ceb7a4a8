#include "dirspec/platform_default.hpp"

#include <array>
#include <format>
#include <string>

namespace dirspec {

namespace {

using Source = DefaultRule::Source;
using Kind = DirectoryKind;

constexpr DefaultRule home_join(std::string_view sub) { return {Source::Home, sub, {}, Kind::Home}; }
constexpr DefaultRule env_join(std::string_view var, std::string_view sub = {}) { return {Source::Env, var, sub, Kind::Home}; }
constexpr DefaultRule env_or(std::string_view var, std::string_view fallback) { return {Source::EnvOr, var, fallback, Kind::Home}; }
constexpr DefaultRule literal(std::string_view path) { return {Source::Literal, path, {}, Kind::Home}; }
constexpr DefaultRule user_runtime() { return {Source::UserRuntime, {}, {}, Kind::Home}; }
constexpr DefaultRule same_as(Kind kind) { return {Source::SameAs, {}, {}, kind}; }
constexpr DefaultRule absent() { return {}; }

struct Row {
    Kind kind;
    DefaultRule on_linux;
    DefaultRule on_macos;
    DefaultRule on_windows;
};

constexpr std::string_view app_support = "Library/Application Support";

// Indexed by DirectoryKind.
constexpr std::array<Row, directory_kind_count> rules = {{
    {Kind::Home,        home_join(""),                home_join(""),                    home_join("")},
    {Kind::BinHome,     home_join(".local/bin"),      home_join(".local/bin"),          env_join("LOCALAPPDATA", "Programs")},
    {Kind::CacheHome,   home_join(".cache"),          home_join("Library/Caches"),      env_join("LOCALAPPDATA")},
    {Kind::ConfigHome,  home_join(".config"),         home_join(app_support),           env_join("APPDATA")},
    {Kind::ConfigLocal, same_as(Kind::ConfigHome),    same_as(Kind::ConfigHome),        env_join("LOCALAPPDATA")},
    {Kind::DataHome,    home_join(".local/share"),    home_join(app_support),           env_join("APPDATA")},
    {Kind::DataLocal,   same_as(Kind::DataHome),      same_as(Kind::DataHome),          env_join("LOCALAPPDATA")},
    {Kind::StateHome,   home_join(".local/state"),    home_join(app_support),           env_join("LOCALAPPDATA")},
    {Kind::Desktop,     home_join("Desktop"),         home_join("Desktop"),             env_join("USERPROFILE", "Desktop")},
    {Kind::Documents,   home_join("Documents"),       home_join("Documents"),           env_join("USERPROFILE", "Documents")},
    {Kind::Downloads,   home_join("Downloads"),       home_join("Downloads"),           env_join("USERPROFILE", "Downloads")},
    {Kind::Music,       home_join("Music"),           home_join("Music"),               env_join("USERPROFILE", "Music")},
    {Kind::Pictures,    home_join("Pictures"),        home_join("Pictures"),            env_join("USERPROFILE", "Pictures")},
    {Kind::Videos,      home_join("Videos"),          home_join("Movies"),              env_join("USERPROFILE", "Videos")},
    {Kind::Templates,   home_join("Templates"),       home_join("Templates"),           env_join("USERPROFILE", "Templates")},
    {Kind::PublicShare, home_join("Public"),          home_join("Public"),              literal("C:\\Users\\Public")},
    {Kind::Runtime,     user_runtime(),               env_or("TMPDIR", "/tmp"),         env_join("TEMP")},
    {Kind::Fonts,       home_join(".local/share/fonts"), home_join("Library/Fonts"),    absent()},
    {Kind::Preferences, same_as(Kind::ConfigHome),    home_join("Library/Preferences"), same_as(Kind::ConfigHome)},
}};

} // namespace

const DefaultRule& default_rule(DirectoryKind kind, platform::Platform platform) {
    const Row& row = rules[static_cast<size_t>(kind)];
    switch (platform) {
    case platform::Platform::MacOS: return row.on_macos;
    case platform::Platform::Windows: return row.on_windows;
    case platform::Platform::Linux: break;
    }
    return row.on_linux;
}

PlatformDefault::PlatformDefault(const Environment& env, const HomeResolver& home,
                                 const XdgOverride& overrides, const platform::UserDatabase& users,
                                 platform::Platform platform)
    : env_(env), home_(home), overrides_(overrides), users_(users), platform_(platform) {}

std::optional<std::filesystem::path> PlatformDefault::resolve(DirectoryKind kind) const {
    return apply(default_rule(kind, platform_));
}

std::optional<std::filesystem::path> PlatformDefault::apply(const DefaultRule& rule) const {
    switch (rule.source) {
    case Source::Home: {
        auto home = home_.resolve();
        if (!home) return std::nullopt;
        // home itself is returned as the environment gives it
        if (rule.arg.empty()) return home;
        return absolute_or_none(platform::join(home->string(), rule.arg, platform_));
    }
    case Source::Env: {
        auto value = non_empty_var(env_, std::string(rule.arg));
        if (!value) return std::nullopt;
        return absolute_or_none(platform::join(*value, rule.extra, platform_));
    }
    case Source::EnvOr: {
        // a relative value counts as unset
        auto value = non_empty_var(env_, std::string(rule.arg));
        if (value && platform::is_absolute(*value, platform_)) return std::filesystem::path(*value);
        return std::filesystem::path(rule.extra);
    }
    case Source::Literal:
        return std::filesystem::path(rule.arg);
    case Source::UserRuntime: {
        auto uid = users_.current_uid();
        if (!uid) return std::nullopt;
        return std::filesystem::path(std::format("/run/user/{}", *uid));
    }
    case Source::SameAs:
        if (auto path = overrides_.resolve(rule.alias)) return path;
        return resolve(rule.alias);
    case Source::Absent:
        break;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> PlatformDefault::absolute_or_none(std::filesystem::path path) const {
    if (!platform::is_absolute(path.string(), platform_)) return std::nullopt;
    return path;
}

} // namespace dirspec
