#pragma once

#include "dirspec/platform/user_database.hpp"

namespace dirspec::platform {

// Windows has no passwd database; home comes from USERPROFILE or
// HOMEDRIVE/HOMEPATH only.
class WindowsUserDatabase : public UserDatabase {
public:
    std::optional<uint32_t> current_uid() const override { return std::nullopt; }
    std::optional<std::string> home_directory(uint32_t) const override { return std::nullopt; }
};

} // namespace dirspec::platform
