#pragma once

#include "dirspec/platform/user_database.hpp"

namespace dirspec::platform {

class PasswdUserDatabase : public UserDatabase {
public:
    std::optional<uint32_t> current_uid() const override;
    std::optional<std::string> home_directory(uint32_t uid) const override;
};

} // namespace dirspec::platform
