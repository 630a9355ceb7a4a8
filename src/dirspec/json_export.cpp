#include "dirspec/json_export.hpp"

#include <fstream>
#include <print>

using json = nlohmann::json;

namespace dirspec {

json to_json(const DirectoryResolver& resolver) {
    return to_json(resolver, all_directory_kinds());
}

json to_json(const DirectoryResolver& resolver, std::span<const DirectoryKind> kinds) {
    json j = json::object();
    j["platform"] = std::string(platform::platform_name(resolver.platform()));

    for (auto kind : kinds) {
        auto name = std::string(directory_kind_name(kind));
        if (auto path = resolver.resolve(kind)) {
            j[name] = path->string();
        } else {
            j[name] = nullptr;
        }
    }
    return j;
}

static std::optional<MapEnvironment> environment_from_json(const json& j) {
    if (!j.is_object()) {
        std::println(stderr, "env: expected a JSON object of variables");
        return std::nullopt;
    }

    MapEnvironment env;
    for (auto& [name, value] : j.items()) {
        if (!value.is_string()) {
            std::println(stderr, "env: skipping non-string value for {}", name);
            continue;
        }
        env.set(name, value.get<std::string>());
    }
    return env;
}

std::optional<MapEnvironment> parse_environment(const std::string& text) {
    try {
        return environment_from_json(json::parse(text));
    } catch (const json::exception& e) {
        std::println(stderr, "env: parse error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<MapEnvironment> load_environment(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "env: could not open {}", path);
        return std::nullopt;
    }

    try {
        return environment_from_json(json::parse(f));
    } catch (const json::exception& e) {
        std::println(stderr, "env: parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace dirspec
