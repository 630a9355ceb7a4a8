#include "dirspec/xdg_override.hpp"

#include <string>

namespace dirspec {

XdgOverride::XdgOverride(const Environment& env, platform::Platform platform)
    : env_(env), platform_(platform) {}

std::optional<std::filesystem::path> XdgOverride::resolve(DirectoryKind kind) const {
    auto var = xdg_variable(kind);
    if (!var) return std::nullopt;

    auto value = env_.get(std::string(*var));
    if (!value) return std::nullopt;
    if (!platform::is_absolute(*value, platform_)) return std::nullopt;

    return std::filesystem::path(*value);
}

} // namespace dirspec
