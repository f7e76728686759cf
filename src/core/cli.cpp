#include <envcast/cli.hpp>

#include <cstddef>

namespace envcast {

std::string usage() {
    return
        "usage: envcast [options] [--] [server-command [args...]]\n"
        "\n"
        "Replace $NAME and ${NAME} placeholders in the target files with\n"
        "environment values, then exec the server command.\n"
        "\n"
        "options:\n"
        "  -t, --target GLOB     target glob (repeatable)\n"
        "  -x, --exclude GLOB    exclude glob (repeatable)\n"
        "  -a, --allow NAME      allow-listed variable name (repeatable)\n"
        "      --allow-prefix P  allow variables starting with P\n"
        "      --allow-all       substitute from the whole environment\n"
        "  -c, --config FILE     TOML configuration file\n"
        "      --strict          unresolved placeholders are fatal\n"
        "  -n, --dry-run         report only: write nothing, exec nothing\n"
        "  -v, --verbose         debug logging (twice: trace)\n"
        "  -q, --quiet           only log errors\n"
        "      --no-color        disable colored log output\n"
        "  -h, --help            show this help\n"
        "      --version         show the version\n";
}

static bool takes_value(const std::string& opt) {
    return opt == "-t" || opt == "--target" ||
           opt == "-x" || opt == "--exclude" ||
           opt == "-a" || opt == "--allow" ||
           opt == "--allow-prefix" ||
           opt == "-c" || opt == "--config";
}

static Status apply_value(CliOptions& o, const std::string& opt, const std::string& value) {
    if (value.empty()) {
        return EnvcastError{EnvcastError::InvalidArg,
            "option " + opt + " needs a non-empty value"};
    }
    if (opt == "-t" || opt == "--target") {
        o.settings.targets.push_back(value);
    } else if (opt == "-x" || opt == "--exclude") {
        o.settings.exclude.push_back(value);
    } else if (opt == "-a" || opt == "--allow") {
        o.settings.policy.allow.push_back(value);
    } else if (opt == "--allow-prefix") {
        o.settings.policy.allow_prefix = value;
    } else {
        o.config_path = value;
    }
    return ok_status();
}

static Status apply_flag(CliOptions& o, const std::string& opt) {
    if (opt == "--allow-all") {
        o.settings.policy.allow_all = true;
        o.settings.allow_all_set = true;
    } else if (opt == "--strict") {
        o.settings.strict = true;
        o.settings.strict_set = true;
    } else if (opt == "-n" || opt == "--dry-run") {
        o.settings.dry_run = true;
        o.settings.dry_run_set = true;
    } else if (opt == "-v" || opt == "--verbose") {
        o.verbosity++;
    } else if (opt == "-q" || opt == "--quiet") {
        o.quiet = true;
    } else if (opt == "--no-color") {
        o.settings.color = false;
        o.settings.color_set = true;
    } else if (opt == "-h" || opt == "--help") {
        o.show_help = true;
    } else if (opt == "--version") {
        o.show_version = true;
    } else {
        return EnvcastError{EnvcastError::InvalidArg,
            "unknown option '" + opt + "'", "run envcast --help for usage"};
    }
    return ok_status();
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    CliOptions o;
    size_t i = 0;

    for (; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--") {
            i++;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') break;   // start of the command

        // --name=value
        if (arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                std::string opt = arg.substr(0, eq);
                if (!takes_value(opt)) {
                    return EnvcastError{EnvcastError::InvalidArg,
                        "option " + opt + " does not take a value"};
                }
                ENVCAST_TRY(apply_value(o, opt, arg.substr(eq + 1)));
                continue;
            }
        } else if (arg.size() > 2 && arg.find_first_not_of('v', 1) == std::string::npos) {
            // -vv
            o.verbosity += static_cast<int>(arg.size() - 1);
            continue;
        }

        if (takes_value(arg)) {
            if (i + 1 >= args.size()) {
                return EnvcastError{EnvcastError::InvalidArg,
                    "option " + arg + " needs a value"};
            }
            ENVCAST_TRY(apply_value(o, arg, args[++i]));
            continue;
        }
        ENVCAST_TRY(apply_flag(o, arg));
    }

    o.settings.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return Result<CliOptions>::ok(std::move(o));
}

} // namespace envcast
