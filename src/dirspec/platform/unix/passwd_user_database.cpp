#include "dirspec/platform/unix/passwd_user_database.hpp"

#include <cerrno>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace dirspec::platform {

std::optional<uint32_t> PasswdUserDatabase::current_uid() const {
    return static_cast<uint32_t>(::geteuid());
}

std::optional<std::string> PasswdUserDatabase::home_directory(uint32_t uid) const {
    long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(hint > 0 ? static_cast<size_t>(hint) : 1024);

    passwd pw{};
    passwd* result = nullptr;
    int rc;
    while ((rc = ::getpwuid_r(static_cast<uid_t>(uid), &pw, buf.data(), buf.size(), &result)) == ERANGE) {
        if (buf.size() >= (1u << 20)) return std::nullopt;
        buf.resize(buf.size() * 2);
    }

    if (rc != 0 || !result) return std::nullopt;
    if (!result->pw_dir || result->pw_dir[0] == '\0') return std::nullopt;
    return std::string(result->pw_dir);
}

std::unique_ptr<UserDatabase> make_system_user_database() {
    return std::make_unique<PasswdUserDatabase>();
}

} // namespace dirspec::platform
