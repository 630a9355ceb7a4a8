#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace dirspec {

class Environment {
public:
    virtual ~Environment() = default;
    virtual std::optional<std::string> get(const std::string& name) const = 0;
};

// Reads the live process environment on every call.
class ProcessEnvironment : public Environment {
public:
    std::optional<std::string> get(const std::string& name) const override;
};

// Fixed set of variables, independent of the process.
class MapEnvironment : public Environment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string> vars);

    std::optional<std::string> get(const std::string& name) const override;

    void set(const std::string& name, std::string value);
    void unset(const std::string& name);
    size_t size() const { return vars_.size(); }

private:
    std::map<std::string, std::string> vars_;
};

} // namespace dirspec
