#include "dirspec/dirs.hpp"

#include "dirspec/directory_resolver.hpp"
#include "dirspec/environment.hpp"
#include "dirspec/platform/user_database.hpp"

namespace dirspec {

namespace {

ResolvedPath resolve_host(DirectoryKind kind) {
    ProcessEnvironment env;
    auto users = platform::make_system_user_database();
    DirectoryResolver resolver(env, *users);
    return resolver.resolve(kind);
}

} // namespace

ResolvedPath home() { return resolve_host(DirectoryKind::Home); }
ResolvedPath bin_home() { return resolve_host(DirectoryKind::BinHome); }
ResolvedPath cache_home() { return resolve_host(DirectoryKind::CacheHome); }
ResolvedPath config_home() { return resolve_host(DirectoryKind::ConfigHome); }
ResolvedPath config_local() { return resolve_host(DirectoryKind::ConfigLocal); }
ResolvedPath data_home() { return resolve_host(DirectoryKind::DataHome); }
ResolvedPath data_local() { return resolve_host(DirectoryKind::DataLocal); }
ResolvedPath state_home() { return resolve_host(DirectoryKind::StateHome); }
ResolvedPath desktop() { return resolve_host(DirectoryKind::Desktop); }
ResolvedPath documents() { return resolve_host(DirectoryKind::Documents); }
ResolvedPath downloads() { return resolve_host(DirectoryKind::Downloads); }
ResolvedPath music() { return resolve_host(DirectoryKind::Music); }
ResolvedPath pictures() { return resolve_host(DirectoryKind::Pictures); }
ResolvedPath videos() { return resolve_host(DirectoryKind::Videos); }
ResolvedPath templates() { return resolve_host(DirectoryKind::Templates); }
ResolvedPath publicshare() { return resolve_host(DirectoryKind::PublicShare); }
ResolvedPath runtime() { return resolve_host(DirectoryKind::Runtime); }
ResolvedPath fonts() { return resolve_host(DirectoryKind::Fonts); }
ResolvedPath preferences() { return resolve_host(DirectoryKind::Preferences); }

} // namespace dirspec
