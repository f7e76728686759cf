#pragma once

#include <envcast/env.hpp>
#include <envcast/log.hpp>
#include <envcast/result.hpp>
#include <string>
#include <vector>

namespace envcast {

// Layered settings: defaults < config file < ENVCAST_* environment < flags.
// Later layers override earlier ones; a non-empty list replaces the list
// below it rather than appending.
struct Settings {
    std::vector<std::string> targets;
    std::vector<std::string> exclude;
    EnvPolicy policy;
    bool strict = false;
    bool dry_run = false;
    log::Level log_level = log::Info;
    bool color = true;
    std::vector<std::string> command;

    // Track which scalar fields were explicitly set (for merge)
    bool strict_set = false;
    bool dry_run_set = false;
    bool allow_all_set = false;
    bool log_level_set = false;
    bool color_set = false;

    // Load from a TOML config file
    static Result<Settings> load(const std::string& path);

    // Parse from TOML string
    static Result<Settings> parse(const std::string& toml_str);

    // Read the ENVCAST_* variables from a snapshot
    static Result<Settings> from_env(const EnvSnapshot& env);

    // Merge another layer on top (other's values override this)
    void merge(const Settings& other);

    // Checks that only make sense on the final, merged settings
    Status validate() const;
};

// Config file used when neither --config nor ENVCAST_CONFIG is given
constexpr const char* kDefaultConfigPath = "/etc/envcast.toml";

// Parse "1/true/yes/on" and "0/false/no/off" (case-insensitive).
Result<bool> parse_bool(const std::string& name, const std::string& value);

} // namespace envcast
