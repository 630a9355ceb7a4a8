#pragma once

#include <filesystem>
#include <optional>

// Free functions resolving against the live process environment and the
// host platform. Each call reads the environment afresh.
namespace dirspec {

std::optional<std::filesystem::path> home();
std::optional<std::filesystem::path> bin_home();
std::optional<std::filesystem::path> cache_home();
std::optional<std::filesystem::path> config_home();
std::optional<std::filesystem::path> config_local();
std::optional<std::filesystem::path> data_home();
std::optional<std::filesystem::path> data_local();
std::optional<std::filesystem::path> state_home();
std::optional<std::filesystem::path> desktop();
std::optional<std::filesystem::path> documents();
std::optional<std::filesystem::path> downloads();
std::optional<std::filesystem::path> music();
std::optional<std::filesystem::path> pictures();
std::optional<std::filesystem::path> videos();
std::optional<std::filesystem::path> templates();
std::optional<std::filesystem::path> publicshare();
std::optional<std::filesystem::path> runtime();
std::optional<std::filesystem::path> fonts();
std::optional<std::filesystem::path> preferences();

} // namespace dirspec
