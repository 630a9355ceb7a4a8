#pragma once

#include "dirspec/directory_resolver.hpp"
#include "dirspec/environment.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>

namespace dirspec {

// {"platform": "linux", "config_home": "/home/u/.config", "fonts": null, ...}
nlohmann::json to_json(const DirectoryResolver& resolver);
nlohmann::json to_json(const DirectoryResolver& resolver, std::span<const DirectoryKind> kinds);

// Build an environment from a JSON object of string values. Non-string
// values are skipped. Returns nullopt (and reports on stderr) on malformed
// input.
std::optional<MapEnvironment> parse_environment(const std::string& text);
std::optional<MapEnvironment> load_environment(const std::string& path);

} // namespace dirspec
