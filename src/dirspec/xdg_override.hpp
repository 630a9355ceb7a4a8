#pragma once

#include "dirspec/directory_kind.hpp"
#include "dirspec/environment.hpp"
#include "dirspec/platform/platform.hpp"

#include <filesystem>
#include <optional>

namespace dirspec {

// Looks up the XDG variable assigned to a kind. Relative values are
// ignored entirely, per the XDG Base Directory rules.
class XdgOverride {
public:
    XdgOverride(const Environment& env, platform::Platform platform);

    std::optional<std::filesystem::path> resolve(DirectoryKind kind) const;

private:
    const Environment& env_;
    platform::Platform platform_;
};

} // namespace dirspec
