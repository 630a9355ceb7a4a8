#include "dirspec/environment.hpp"

#include <cstdlib>

namespace dirspec {

std::optional<std::string> ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

MapEnvironment::MapEnvironment(std::map<std::string, std::string> vars)
    : vars_(std::move(vars)) {}

std::optional<std::string> MapEnvironment::get(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

void MapEnvironment::set(const std::string& name, std::string value) {
    vars_[name] = std::move(value);
}

void MapEnvironment::unset(const std::string& name) {
    vars_.erase(name);
}

} // namespace dirspec
