#pragma once

#include <envcast/config.hpp>
#include <envcast/env.hpp>
#include <envcast/result.hpp>
#include <string>
#include <vector>

namespace envcast {

constexpr const char* kVersion = "1.0.0";

enum ExitCode {
    kExitOk = 0,
    kExitFailure = 1,     // materialization failed
    kExitUsage = 2,       // bad arguments or configuration
    kExitExecFailed = 127
};

struct CliOptions {
    Settings settings;          // flag layer, merged last
    std::string config_path;
    int verbosity = 0;          // -v count
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse arguments (without argv[0]). Option parsing stops at "--" or at
// the first non-option argument; everything from there on is the server
// command, so `envcast -t '*.js' nginx -g 'daemon off;'` works.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

std::string usage();

// Resolve settings from every layer. The config file is --config, then
// ENVCAST_CONFIG, then kDefaultConfigPath when it exists.
Result<Settings> resolve_settings(const CliOptions& cli, const EnvSnapshot& env);

// Whole program: configure, materialize, then exec the server command.
// Only returns when there is no command, on dry runs, or on failure.
int run_app(const std::vector<std::string>& args, const EnvSnapshot& env);

} // namespace envcast
