#include "dirspec/platform/windows/windows_user_database.hpp"

namespace dirspec::platform {

std::unique_ptr<UserDatabase> make_system_user_database() {
    return std::make_unique<WindowsUserDatabase>();
}

} // namespace dirspec::platform
