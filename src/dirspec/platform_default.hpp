#pragma once

#include "dirspec/directory_kind.hpp"
#include "dirspec/environment.hpp"
#include "dirspec/home_resolver.hpp"
#include "dirspec/platform/platform.hpp"
#include "dirspec/platform/user_database.hpp"
#include "dirspec/xdg_override.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace dirspec {

// How a kind's fallback is derived on one platform.
struct DefaultRule {
    enum class Source {
        Home,        // home joined with `arg` (home itself when `arg` is empty)
        Env,         // value of variable `arg`, joined with `extra`
        EnvOr,       // value of variable `arg`, or the literal `extra`
        Literal,     // `arg` verbatim
        UserRuntime, // /run/user/{uid}, absent without a uid
        SameAs,      // full resolution of `alias`, its override included
        Absent,      // no convention on this platform
    };

    Source source = Source::Absent;
    std::string_view arg;
    std::string_view extra;
    DirectoryKind alias = DirectoryKind::Home;
};

const DefaultRule& default_rule(DirectoryKind kind, platform::Platform platform);

class PlatformDefault {
public:
    PlatformDefault(const Environment& env, const HomeResolver& home, const XdgOverride& overrides,
                    const platform::UserDatabase& users, platform::Platform platform);

    std::optional<std::filesystem::path> resolve(DirectoryKind kind) const;

private:
    std::optional<std::filesystem::path> apply(const DefaultRule& rule) const;
    std::optional<std::filesystem::path> absolute_or_none(std::filesystem::path path) const;

    const Environment& env_;
    const HomeResolver& home_;
    const XdgOverride& overrides_;
    const platform::UserDatabase& users_;
    platform::Platform platform_;
};

} // namespace dirspec
