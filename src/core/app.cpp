#include <envcast/cli.hpp>
#include <envcast/handoff.hpp>
#include <envcast/log.hpp>
#include <envcast/materializer.hpp>

#include <filesystem>
#include <iostream>

namespace envcast {

// Variables that configure envcast itself are never substituted
static constexpr const char* kOwnPrefix = "ENVCAST_";

Result<Settings> resolve_settings(const CliOptions& cli, const EnvSnapshot& env) {
    Settings settings;

    std::string config_path = cli.config_path;
    if (config_path.empty()) {
        if (auto v = env.find("ENVCAST_CONFIG")) config_path = *v;
    }
    if (config_path.empty()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(kDefaultConfigPath, ec)) {
            config_path = kDefaultConfigPath;
        }
    }

    if (!config_path.empty()) {
        log::debug("loading config from %s", config_path.c_str());
        auto file = Settings::load(config_path);
        if (file.is_err()) return std::move(file).error();
        settings.merge(file.value());
    }

    auto from_env = Settings::from_env(env);
    if (from_env.is_err()) return std::move(from_env).error();
    settings.merge(from_env.value());

    settings.merge(cli.settings);

    ENVCAST_TRY(settings.validate());
    return Result<Settings>::ok(std::move(settings));
}

static void apply_log_settings(const Settings& settings, const CliOptions& cli) {
    log::Level level = settings.log_level;
    if (cli.quiet) {
        level = log::Error;
    } else if (cli.verbosity >= 2) {
        level = log::Trace;
    } else if (cli.verbosity == 1) {
        level = log::Debug;
    }
    log::set_level(level);
    if (settings.color_set && !settings.color) log::set_color_enabled(false);
}

static void print_report(const MaterializeReport& report) {
    for (const auto& f : report.files) {
        std::cout << f.path << ": " << f.substitutions << " substitution(s)";
        if (!f.unresolved.empty()) {
            std::cout << ", unresolved:";
            for (const auto& n : f.unresolved) std::cout << " $" << n;
        }
        std::cout << "\n";
    }
    std::cout << report.files_processed << " file(s), "
              << report.substitutions << " substitution(s)\n";
}

int run_app(const std::vector<std::string>& args, const EnvSnapshot& env) {
    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        std::cerr << parsed.error().format() << "\n";
        return kExitUsage;
    }
    const CliOptions& cli = parsed.value();

    if (cli.show_help) {
        std::cout << usage();
        return kExitOk;
    }
    if (cli.show_version) {
        std::cout << "envcast " << kVersion << "\n";
        return kExitOk;
    }

    // Flags must already apply while the config is being read
    if (cli.quiet) log::set_level(log::Error);
    else if (cli.verbosity > 0) log::set_level(cli.verbosity > 1 ? log::Trace : log::Debug);

    auto settings_res = resolve_settings(cli, env);
    if (settings_res.is_err()) {
        std::cerr << settings_res.error().format() << "\n";
        return kExitUsage;
    }
    const Settings& settings = settings_res.value();
    apply_log_settings(settings, cli);

    if (!settings.policy.configured()) {
        log::warn("no allow-list configured; any environment variable can be "
                  "substituted into served files (set --allow, --allow-prefix or --allow-all)");
    }
    EnvSnapshot sources = env.without_prefix(kOwnPrefix).select(settings.policy);
    log::debug("%zu variable(s) available for substitution", sources.size());

    MaterializeOptions opts;
    opts.exclude = settings.exclude;
    opts.strict = settings.strict;
    opts.dry_run = settings.dry_run;

    auto report = materialize_all(settings.targets, sources, opts);
    if (report.is_err()) {
        log::error("materialization failed; not starting the server");
        std::cerr << report.error().format() << "\n";
        return kExitFailure;
    }

    if (settings.dry_run) {
        print_report(report.value());
        return kExitOk;
    }
    if (settings.command.empty()) {
        log::debug("no server command given; exiting");
        return kExitOk;
    }

    auto st = exec_server(settings.command);
    if (st.is_err()) {
        std::cerr << st.error().format() << "\n";
        if (st.error().code == EnvcastError::InvalidArg) return kExitUsage;
    }
    return kExitExecFailed;
}

} // namespace envcast
