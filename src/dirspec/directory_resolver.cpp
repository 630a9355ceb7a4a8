#include "dirspec/directory_resolver.hpp"

namespace dirspec {

DirectoryResolver::DirectoryResolver(const Environment& env, const platform::UserDatabase& users,
                                     platform::Platform platform)
    : platform_(platform),
      home_(env, users, platform),
      overrides_(env, platform),
      defaults_(env, home_, overrides_, users, platform) {}

ResolvedPath DirectoryResolver::resolve(DirectoryKind kind) const {
    if (auto path = overrides_.resolve(kind)) return path;
    return defaults_.resolve(kind);
}

} // namespace dirspec
