#include "dirspec/directory_kind.hpp"
#include "dirspec/directory_resolver.hpp"
#include "dirspec/environment.hpp"
#include "dirspec/json_export.hpp"
#include "dirspec/platform/platform.hpp"
#include "dirspec/platform/user_database.hpp"

#include <memory>
#include <print>
#include <string>
#include <vector>

using namespace dirspec;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] [kind...]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  --json                            Print a JSON object");
    std::println(stderr, "  --platform linux|macos|windows    Resolve for another platform");
    std::println(stderr, "  --env FILE                        Read variables from a JSON object");
    std::println(stderr, "                                    instead of the process environment");
    std::println(stderr, "  -h, --help                        Show this help");
    std::println(stderr, "Kinds:");
    for (auto kind : all_directory_kinds()) {
        std::println(stderr, "  {}", directory_kind_name(kind));
    }
}

int main(int argc, char* argv[]) {
    bool as_json = false;
    auto target = platform::host_platform();
    std::string env_path;
    std::vector<DirectoryKind> kinds;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json") {
            as_json = true;
        } else if (arg == "--platform" && i + 1 < argc) {
            auto parsed = platform::parse_platform(argv[++i]);
            if (!parsed) {
                std::println(stderr, "Unknown platform: {}", argv[i]);
                return 1;
            }
            target = *parsed;
        } else if (arg == "--env" && i + 1 < argc) {
            env_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (auto kind = parse_directory_kind(arg)) {
            kinds.push_back(*kind);
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    if (kinds.empty()) {
        kinds.assign(all_directory_kinds().begin(), all_directory_kinds().end());
    }

    std::unique_ptr<Environment> env;
    if (env_path.empty()) {
        env = std::make_unique<ProcessEnvironment>();
    } else {
        auto loaded = load_environment(env_path);
        if (!loaded) return 1;
        env = std::make_unique<MapEnvironment>(std::move(*loaded));
    }

    auto users = platform::make_system_user_database();
    DirectoryResolver resolver(*env, *users, target);

    if (as_json) {
        std::println("{}", to_json(resolver, kinds).dump(2));
        return 0;
    }

    for (auto kind : kinds) {
        auto path = resolver.resolve(kind);
        std::println("{}: {}", directory_kind_name(kind), path ? path->string() : "<unset>");
    }
    return 0;
}
