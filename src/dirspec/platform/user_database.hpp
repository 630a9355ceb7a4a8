#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace dirspec::platform {

// The system user-account database (passwd on Unix).
class UserDatabase {
public:
    virtual ~UserDatabase() = default;

    // Effective UID of the calling process; nullopt where the host has no
    // numeric user ids.
    virtual std::optional<uint32_t> current_uid() const = 0;

    // Home-directory field recorded for `uid`, if the entry exists and the
    // field is non-empty.
    virtual std::optional<std::string> home_directory(uint32_t uid) const = 0;
};

// Database for the host system. Never null.
std::unique_ptr<UserDatabase> make_system_user_database();

} // namespace dirspec::platform
