// scripthost - runs guest scripts against a headless scene host

#include "../scriptscene/core/config.hpp"
#include "../scriptscene/core/logger.hpp"
#include "../scriptscene/host/host_context.hpp"
#include "../scriptscene/scripting/script_host.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#ifndef SCRIPTSCENE_VERSION
#define SCRIPTSCENE_VERSION "0.0.0-dev"
#endif

namespace {

void print_usage(const char* progname) {
    std::cout << "Usage: " << progname << " [options] script.lua [script2.lua ...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>     INI config file (default: scripthost.ini if present)\n";
    std::cout << "  --ticks <n>         Number of ticks to run (overrides [host] ticks)\n";
    std::cout << "  --help              Show this help message\n";
}

struct Args {
    std::string configPath{"scripthost.ini"};
    bool configExplicit = false;
    int ticks = -1;
    std::vector<std::string> scripts;
    bool help = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            args.help = true;
        }
        else if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            args.configPath = argv[++i];
            args.configExplicit = true;
        }
        else if (std::strcmp(arg, "--ticks") == 0 && i + 1 < argc) {
            args.ticks = std::atoi(argv[++i]);
        }
        else if (std::strncmp(arg, "--", 2) == 0) {
            std::cerr << "[WARNING] Unknown argument: " << arg << "\n";
        }
        else {
            args.scripts.emplace_back(arg);
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace scriptscene;

    Args args = parse_args(argc, argv);

    if (args.help || args.scripts.empty()) {
        print_usage(argv[0]);
        return args.help ? 0 : 1;
    }

    core::HostConfig config;
    core::ConfigLoader loader(config);
    std::string configError;
    const bool configLoaded = loader.load_from_file(args.configPath, &configError);

    core::Logger::instance().init(config.logging);
    if (configLoaded) {
        core::logf(LogLevel::Info, "init", "scripthost v%s, config %s", SCRIPTSCENE_VERSION,
                   loader.loaded_from_path().c_str());
    } else {
        core::logf(args.configExplicit ? LogLevel::Warning : LogLevel::Info, "init",
                   "scripthost v%s, %s; using defaults", SCRIPTSCENE_VERSION, configError.c_str());
    }

    if (args.ticks >= 0) {
        config.host.ticks = args.ticks;
    }

    host::HostContext host(config);

    // Host-owned scene shared with every script.
    const ResourceId environmentScene = host.create_resource(nullptr, "environment", resource::Scene{}).id;
    host.set_environment_scene(environmentScene);
    const std::size_t baseline = host.registry().size();

    int exitCode = 0;
    {
        scripting::ScriptHost scripts(host);

        for (const auto& path : args.scripts) {
            EnvironmentId id = 0;
            auto result = scripts.load_file(path, &id);
            if (!result) {
                core::logf(LogLevel::Error, "init", "%s", result.error.c_str());
                exitCode = 1;
                continue;
            }
            core::logf(LogLevel::Info, "init", "loaded %s as environment %u", path.c_str(), id);
        }

        const float tickRate = config.host.tick_rate > 0.0f ? config.host.tick_rate : 30.0f;
        const float dt = 1.0f / tickRate;
        for (int tick = 0; tick < config.host.ticks; ++tick) {
            scripts.update(dt);
        }

        scripts.unload_all();
    }

    const std::size_t remaining = host.registry().size();
    core::logf(LogLevel::Info, "init", "ran %d ticks; registry holds %zu resources (baseline %zu)",
               config.host.ticks, remaining, baseline);
    if (remaining > baseline) {
        core::logf(LogLevel::Error, "init", "%zu resources leaked by unloaded scripts", remaining - baseline);
        exitCode = 1;
    }

    core::Logger::instance().shutdown();
    return exitCode;
}
