#include "dirspec/home_resolver.hpp"

namespace dirspec {

std::optional<std::string> non_empty_var(const Environment& env, const std::string& name) {
    auto value = env.get(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

HomeResolver::HomeResolver(const Environment& env, const platform::UserDatabase& users,
                           platform::Platform platform)
    : env_(env), users_(users), platform_(platform) {}

std::optional<std::filesystem::path> HomeResolver::resolve() const {
    if (platform_ == platform::Platform::Windows) return resolve_windows();
    return resolve_unix();
}

std::optional<std::filesystem::path> HomeResolver::resolve_unix() const {
    if (auto home = non_empty_var(env_, "HOME")) return std::filesystem::path(*home);

    auto uid = users_.current_uid();
    if (!uid) return std::nullopt;
    auto dir = users_.home_directory(*uid);
    if (!dir) return std::nullopt;
    return std::filesystem::path(*dir);
}

std::optional<std::filesystem::path> HomeResolver::resolve_windows() const {
    if (auto profile = non_empty_var(env_, "USERPROFILE")) return std::filesystem::path(*profile);

    auto drive = non_empty_var(env_, "HOMEDRIVE");
    auto path = non_empty_var(env_, "HOMEPATH");
    if (drive && path) return std::filesystem::path(*drive + *path);
    return std::nullopt;
}

} // namespace dirspec
