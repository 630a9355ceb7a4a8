#pragma once

#include "dirspec/environment.hpp"
#include "dirspec/platform/platform.hpp"
#include "dirspec/platform/user_database.hpp"

#include <filesystem>
#include <optional>

namespace dirspec {

class HomeResolver {
public:
    HomeResolver(const Environment& env, const platform::UserDatabase& users,
                 platform::Platform platform);

    // Unix: $HOME, then the user database entry for the effective UID.
    // Windows: %USERPROFILE%, then %HOMEDRIVE%%HOMEPATH%.
    std::optional<std::filesystem::path> resolve() const;

private:
    std::optional<std::filesystem::path> resolve_unix() const;
    std::optional<std::filesystem::path> resolve_windows() const;

    const Environment& env_;
    const platform::UserDatabase& users_;
    platform::Platform platform_;
};

// Read `name`, treating an empty value as unset.
std::optional<std::string> non_empty_var(const Environment& env, const std::string& name);

} // namespace dirspec
