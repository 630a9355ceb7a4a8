#include <catch2/catch_test_macros.hpp>

#include "dirspec/environment.hpp"
#include "dirspec/home_resolver.hpp"
#include "dirspec/platform_default.hpp"
#include "dirspec/xdg_override.hpp"
#include "mock_user_database.hpp"

#include <string>

using namespace dirspec;
using platform::Platform;

namespace {

// Wires the defaults layer alone, without the resolver's override step.
struct Defaults {
    Defaults(const Environment& env, const MockUserDatabase& users, Platform p)
        : home(env, users, p), xdg(env, p), defaults(env, home, xdg, users, p) {}

    std::string get(DirectoryKind kind) const {
        auto path = defaults.resolve(kind);
        return path ? path->string() : "<none>";
    }

    HomeResolver home;
    XdgOverride xdg;
    PlatformDefault defaults;
};

} // namespace

TEST_CASE("PlatformDefault Linux", "[defaults]") {
    MapEnvironment env({{"HOME", "/home/u"}});
    MockUserDatabase users;
    Defaults d(env, users, Platform::Linux);

    REQUIRE(d.get(DirectoryKind::Home) == "/home/u");
    REQUIRE(d.get(DirectoryKind::BinHome) == "/home/u/.local/bin");
    REQUIRE(d.get(DirectoryKind::CacheHome) == "/home/u/.cache");
    REQUIRE(d.get(DirectoryKind::ConfigHome) == "/home/u/.config");
    REQUIRE(d.get(DirectoryKind::ConfigLocal) == "/home/u/.config");
    REQUIRE(d.get(DirectoryKind::DataHome) == "/home/u/.local/share");
    REQUIRE(d.get(DirectoryKind::DataLocal) == "/home/u/.local/share");
    REQUIRE(d.get(DirectoryKind::StateHome) == "/home/u/.local/state");
    REQUIRE(d.get(DirectoryKind::Desktop) == "/home/u/Desktop");
    REQUIRE(d.get(DirectoryKind::Documents) == "/home/u/Documents");
    REQUIRE(d.get(DirectoryKind::Downloads) == "/home/u/Downloads");
    REQUIRE(d.get(DirectoryKind::Music) == "/home/u/Music");
    REQUIRE(d.get(DirectoryKind::Pictures) == "/home/u/Pictures");
    REQUIRE(d.get(DirectoryKind::Videos) == "/home/u/Videos");
    REQUIRE(d.get(DirectoryKind::Templates) == "/home/u/Templates");
    REQUIRE(d.get(DirectoryKind::PublicShare) == "/home/u/Public");
    REQUIRE(d.get(DirectoryKind::Runtime) == "/run/user/1000");
    REQUIRE(d.get(DirectoryKind::Fonts) == "/home/u/.local/share/fonts");
    REQUIRE(d.get(DirectoryKind::Preferences) == "/home/u/.config");
}

TEST_CASE("PlatformDefault macOS", "[defaults]") {
    MapEnvironment env({{"HOME", "/Users/u"}});
    MockUserDatabase users;
    Defaults d(env, users, Platform::MacOS);

    REQUIRE(d.get(DirectoryKind::Home) == "/Users/u");
    REQUIRE(d.get(DirectoryKind::BinHome) == "/Users/u/.local/bin");
    REQUIRE(d.get(DirectoryKind::CacheHome) == "/Users/u/Library/Caches");
    REQUIRE(d.get(DirectoryKind::ConfigHome) == "/Users/u/Library/Application Support");
    REQUIRE(d.get(DirectoryKind::ConfigLocal) == "/Users/u/Library/Application Support");
    REQUIRE(d.get(DirectoryKind::DataHome) == "/Users/u/Library/Application Support");
    REQUIRE(d.get(DirectoryKind::DataLocal) == "/Users/u/Library/Application Support");
    REQUIRE(d.get(DirectoryKind::StateHome) == "/Users/u/Library/Application Support");
    REQUIRE(d.get(DirectoryKind::Desktop) == "/Users/u/Desktop");
    REQUIRE(d.get(DirectoryKind::Documents) == "/Users/u/Documents");
    REQUIRE(d.get(DirectoryKind::Downloads) == "/Users/u/Downloads");
    REQUIRE(d.get(DirectoryKind::Music) == "/Users/u/Music");
    REQUIRE(d.get(DirectoryKind::Pictures) == "/Users/u/Pictures");
    REQUIRE(d.get(DirectoryKind::Videos) == "/Users/u/Movies");
    REQUIRE(d.get(DirectoryKind::Templates) == "/Users/u/Templates");
    REQUIRE(d.get(DirectoryKind::PublicShare) == "/Users/u/Public");
    REQUIRE(d.get(DirectoryKind::Runtime) == "/tmp");
    REQUIRE(d.get(DirectoryKind::Fonts) == "/Users/u/Library/Fonts");
    REQUIRE(d.get(DirectoryKind::Preferences) == "/Users/u/Library/Preferences");

    env.set("TMPDIR", "/var/folders/xy/T/");
    REQUIRE(d.get(DirectoryKind::Runtime) == "/var/folders/xy/T/");

    env.set("TMPDIR", "relative/tmp");
    REQUIRE(d.get(DirectoryKind::Runtime) == "/tmp");

    env.set("TMPDIR", "");
    REQUIRE(d.get(DirectoryKind::Runtime) == "/tmp");
}

TEST_CASE("PlatformDefault Windows", "[defaults]") {
    MapEnvironment env({
        {"USERPROFILE", "C:\\Users\\u"},
        {"APPDATA", "C:\\Users\\u\\AppData\\Roaming"},
        {"LOCALAPPDATA", "C:\\Users\\u\\AppData\\Local"},
        {"TEMP", "C:\\Users\\u\\AppData\\Local\\Temp"},
    });
    MockUserDatabase users;
    Defaults d(env, users, Platform::Windows);

    REQUIRE(d.get(DirectoryKind::Home) == "C:\\Users\\u");
    REQUIRE(d.get(DirectoryKind::BinHome) == "C:\\Users\\u\\AppData\\Local\\Programs");
    REQUIRE(d.get(DirectoryKind::CacheHome) == "C:\\Users\\u\\AppData\\Local");
    REQUIRE(d.get(DirectoryKind::ConfigHome) == "C:\\Users\\u\\AppData\\Roaming");
    REQUIRE(d.get(DirectoryKind::ConfigLocal) == "C:\\Users\\u\\AppData\\Local");
    REQUIRE(d.get(DirectoryKind::DataHome) == "C:\\Users\\u\\AppData\\Roaming");
    REQUIRE(d.get(DirectoryKind::DataLocal) == "C:\\Users\\u\\AppData\\Local");
    REQUIRE(d.get(DirectoryKind::StateHome) == "C:\\Users\\u\\AppData\\Local");
    REQUIRE(d.get(DirectoryKind::Desktop) == "C:\\Users\\u\\Desktop");
    REQUIRE(d.get(DirectoryKind::Documents) == "C:\\Users\\u\\Documents");
    REQUIRE(d.get(DirectoryKind::Downloads) == "C:\\Users\\u\\Downloads");
    REQUIRE(d.get(DirectoryKind::Music) == "C:\\Users\\u\\Music");
    REQUIRE(d.get(DirectoryKind::Pictures) == "C:\\Users\\u\\Pictures");
    REQUIRE(d.get(DirectoryKind::Videos) == "C:\\Users\\u\\Videos");
    REQUIRE(d.get(DirectoryKind::Templates) == "C:\\Users\\u\\Templates");
    REQUIRE(d.get(DirectoryKind::PublicShare) == "C:\\Users\\Public");
    REQUIRE(d.get(DirectoryKind::Runtime) == "C:\\Users\\u\\AppData\\Local\\Temp");
    REQUIRE(d.get(DirectoryKind::Fonts) == "<none>");
    REQUIRE(d.get(DirectoryKind::Preferences) == "C:\\Users\\u\\AppData\\Roaming");
}

TEST_CASE("PlatformDefault absence", "[defaults]") {
    MapEnvironment env;
    MockUserDatabase users;

    SECTION("HomeDerivedAbsentWithoutHome") {
        Defaults d(env, users, Platform::Linux);
        REQUIRE(d.get(DirectoryKind::Home) == "<none>");
        REQUIRE(d.get(DirectoryKind::ConfigHome) == "<none>");
        REQUIRE(d.get(DirectoryKind::Fonts) == "<none>");
        REQUIRE(d.get(DirectoryKind::Preferences) == "<none>");
        // uid-scoped, needs no home
        REQUIRE(d.get(DirectoryKind::Runtime) == "/run/user/1000");
    }

    SECTION("WindowsVariablesUnset") {
        Defaults d(env, users, Platform::Windows);
        REQUIRE(d.get(DirectoryKind::BinHome) == "<none>");
        REQUIRE(d.get(DirectoryKind::ConfigHome) == "<none>");
        REQUIRE(d.get(DirectoryKind::ConfigLocal) == "<none>");
        REQUIRE(d.get(DirectoryKind::Desktop) == "<none>");
        REQUIRE(d.get(DirectoryKind::Runtime) == "<none>");
        REQUIRE(d.get(DirectoryKind::PublicShare) == "C:\\Users\\Public");
    }

    SECTION("WindowsUserFoldersDoNotFallBackToHomeDrive") {
        env.set("HOMEDRIVE", "C:");
        env.set("HOMEPATH", "\\Users\\u");
        Defaults d(env, users, Platform::Windows);
        REQUIRE(d.get(DirectoryKind::Home) == "C:\\Users\\u");
        REQUIRE(d.get(DirectoryKind::Documents) == "<none>");
    }

    SECTION("RelativeBaseYieldsNoPartialPath") {
        env.set("HOME", "relative/home");
        env.set("LOCALAPPDATA", "AppData\\Local");
        REQUIRE(Defaults(env, users, Platform::Linux).get(DirectoryKind::CacheHome) == "<none>");
        REQUIRE(Defaults(env, users, Platform::Windows).get(DirectoryKind::CacheHome) == "<none>");
    }

    SECTION("RuntimeAbsentWithoutUid") {
        users.uid = std::nullopt;
        users.homes[1000] = "/home/db";
        Defaults d(env, users, Platform::Linux);
        REQUIRE(d.get(DirectoryKind::Runtime) == "<none>");
        REQUIRE(d.get(DirectoryKind::Home) == "<none>");
    }

    SECTION("UserDatabaseHomeUsed") {
        users.homes[1000] = "/home/db";
        Defaults d(env, users, Platform::Linux);
        REQUIRE(d.get(DirectoryKind::DataHome) == "/home/db/.local/share");
    }
}

TEST_CASE("PlatformDefault rule table", "[defaults]") {

    SECTION("AliasesOnlyPointAtKindsWithOwnRules") {
        for (auto p : {Platform::Linux, Platform::MacOS, Platform::Windows}) {
            for (auto kind : all_directory_kinds()) {
                const auto& rule = default_rule(kind, p);
                if (rule.source != DefaultRule::Source::SameAs) continue;
                REQUIRE(rule.alias != kind);
                REQUIRE(default_rule(rule.alias, p).source != DefaultRule::Source::SameAs);
            }
        }
    }

    SECTION("UnixNeverUsesWindowsVariables") {
        for (auto p : {Platform::Linux, Platform::MacOS}) {
            for (auto kind : all_directory_kinds()) {
                auto source = default_rule(kind, p).source;
                REQUIRE(source != DefaultRule::Source::Env);
                REQUIRE(source != DefaultRule::Source::Literal);
                REQUIRE(source != DefaultRule::Source::Absent);
            }
        }
    }

    SECTION("OnlyFontsAbsent") {
        for (auto kind : all_directory_kinds()) {
            bool absent = default_rule(kind, Platform::Windows).source == DefaultRule::Source::Absent;
            REQUIRE(absent == (kind == DirectoryKind::Fonts));
        }
    }
}
