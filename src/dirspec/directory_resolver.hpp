#pragma once

#include "dirspec/directory_kind.hpp"
#include "dirspec/environment.hpp"
#include "dirspec/home_resolver.hpp"
#include "dirspec/platform/platform.hpp"
#include "dirspec/platform/user_database.hpp"
#include "dirspec/platform_default.hpp"
#include "dirspec/xdg_override.hpp"

#include <filesystem>
#include <optional>

namespace dirspec {

using ResolvedPath = std::optional<std::filesystem::path>;

// Resolves every DirectoryKind for one platform: an absolute XDG override
// wins, otherwise the platform's conventional location. Holds no state
// beyond references to `env` and `users`, which must outlive it.
class DirectoryResolver {
public:
    DirectoryResolver(const Environment& env, const platform::UserDatabase& users,
                      platform::Platform platform = platform::host_platform());

    DirectoryResolver(const DirectoryResolver&) = delete;
    DirectoryResolver& operator=(const DirectoryResolver&) = delete;

    ResolvedPath resolve(DirectoryKind kind) const;

    platform::Platform platform() const { return platform_; }

    ResolvedPath home() const { return resolve(DirectoryKind::Home); }
    ResolvedPath bin_home() const { return resolve(DirectoryKind::BinHome); }
    ResolvedPath cache_home() const { return resolve(DirectoryKind::CacheHome); }
    ResolvedPath config_home() const { return resolve(DirectoryKind::ConfigHome); }
    ResolvedPath config_local() const { return resolve(DirectoryKind::ConfigLocal); }
    ResolvedPath data_home() const { return resolve(DirectoryKind::DataHome); }
    ResolvedPath data_local() const { return resolve(DirectoryKind::DataLocal); }
    ResolvedPath state_home() const { return resolve(DirectoryKind::StateHome); }
    ResolvedPath desktop() const { return resolve(DirectoryKind::Desktop); }
    ResolvedPath documents() const { return resolve(DirectoryKind::Documents); }
    ResolvedPath downloads() const { return resolve(DirectoryKind::Downloads); }
    ResolvedPath music() const { return resolve(DirectoryKind::Music); }
    ResolvedPath pictures() const { return resolve(DirectoryKind::Pictures); }
    ResolvedPath videos() const { return resolve(DirectoryKind::Videos); }
    ResolvedPath templates() const { return resolve(DirectoryKind::Templates); }
    ResolvedPath publicshare() const { return resolve(DirectoryKind::PublicShare); }
    ResolvedPath runtime() const { return resolve(DirectoryKind::Runtime); }
    ResolvedPath fonts() const { return resolve(DirectoryKind::Fonts); }
    ResolvedPath preferences() const { return resolve(DirectoryKind::Preferences); }

private:
    platform::Platform platform_;
    HomeResolver home_;
    XdgOverride overrides_;
    PlatformDefault defaults_;
};

} // namespace dirspec
