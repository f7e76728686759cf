#include <envcast/config.hpp>
#include <envcast/atomic_file.hpp>
#include <envcast/glob.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cctype>

namespace envcast {

static EnvcastError type_error(const std::string& key, const char* expected) {
    return EnvcastError{EnvcastError::Config,
        "config key '" + key + "' must be " + expected};
}

// Accept either a single string or an array of strings
static Status read_string_list(const toml::table& tbl, const std::string& section,
                               const char* key, std::vector<std::string>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();

    std::string full = section + "." + key;
    if (auto s = node->value<std::string>()) {
        out = {*s};
        return ok_status();
    }
    auto* arr = node->as_array();
    if (!arr) return type_error(full, "a string or an array of strings");

    std::vector<std::string> items;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return type_error(full, "an array of strings");
        items.push_back(*s);
    }
    out = std::move(items);
    return ok_status();
}

static Status read_bool(const toml::table& tbl, const std::string& section,
                        const char* key, bool& out, bool& set_flag) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<bool>();
    if (!v || !node->is_boolean()) return type_error(section + "." + key, "a boolean");
    out = *v;
    set_flag = true;
    return ok_status();
}

static Status read_string(const toml::table& tbl, const std::string& section,
                          const char* key, std::string& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!v) return type_error(section + "." + key, "a string");
    out = *v;
    return ok_status();
}

Result<Settings> Settings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return EnvcastError{EnvcastError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Settings s;

    // [materialize] section
    if (auto mat = doc["materialize"].as_table()) {
        ENVCAST_TRY(read_string_list(*mat, "materialize", "targets", s.targets));
        ENVCAST_TRY(read_string_list(*mat, "materialize", "exclude", s.exclude));
        ENVCAST_TRY(read_bool(*mat, "materialize", "strict", s.strict, s.strict_set));
    }

    // [env] section
    if (auto env = doc["env"].as_table()) {
        ENVCAST_TRY(read_string_list(*env, "env", "allow", s.policy.allow));
        ENVCAST_TRY(read_string(*env, "env", "allow_prefix", s.policy.allow_prefix));
        ENVCAST_TRY(read_bool(*env, "env", "allow_all", s.policy.allow_all, s.allow_all_set));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        std::string level;
        ENVCAST_TRY(read_string(*lg, "log", "level", level));
        if (!level.empty()) {
            auto lvl = log::parse_level(level);
            if (lvl.is_err()) return std::move(lvl).error();
            s.log_level = lvl.value();
            s.log_level_set = true;
        }
        ENVCAST_TRY(read_bool(*lg, "log", "color", s.color, s.color_set));
    }

    // [exec] section
    if (auto ex = doc["exec"].as_table()) {
        const toml::node* cmd = ex->get("command");
        if (cmd && !cmd->is_array()) {
            return type_error("exec.command", "an array of strings");
        }
        ENVCAST_TRY(read_string_list(*ex, "exec", "command", s.command));
    }

    return Result<Settings>::ok(std::move(s));
}

Result<Settings> Settings::load(const std::string& path) {
    auto text = read_file(path);
    if (text.is_err()) {
        auto err = std::move(text).error();
        err.message = "cannot read config file: " + err.message;
        return err;
    }
    auto parsed = Settings::parse(text.value());
    if (parsed.is_err()) {
        auto err = std::move(parsed).error();
        err.file = path;
        return err;
    }
    return parsed;
}

Result<bool> parse_bool(const std::string& name, const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return Result<bool>::ok(true);
    }
    if (lower.empty() || lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return Result<bool>::ok(false);
    }
    return EnvcastError{EnvcastError::Config,
        name + " has invalid boolean value '" + value + "'",
        "use 1/0, true/false, yes/no or on/off"};
}

static std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&]() {
        auto start = cur.find_first_not_of(" \t");
        if (start != std::string::npos) {
            auto end = cur.find_last_not_of(" \t");
            out.push_back(cur.substr(start, end - start + 1));
        }
        cur.clear();
    };
    for (char c : s) {
        if (c == sep) flush();
        else cur.push_back(c);
    }
    flush();
    return out;
}

Result<Settings> Settings::from_env(const EnvSnapshot& env) {
    Settings s;

    if (auto v = env.find("ENVCAST_TARGET")) s.targets = split_list(*v, ':');
    if (auto v = env.find("ENVCAST_EXCLUDE")) s.exclude = split_list(*v, ':');
    if (auto v = env.find("ENVCAST_ALLOW")) s.policy.allow = split_list(*v, ',');
    if (auto v = env.find("ENVCAST_ALLOW_PREFIX")) s.policy.allow_prefix = *v;

    if (auto v = env.find("ENVCAST_ALLOW_ALL")) {
        auto b = parse_bool("ENVCAST_ALLOW_ALL", *v);
        if (b.is_err()) return std::move(b).error();
        s.policy.allow_all = b.value();
        s.allow_all_set = true;
    }
    if (auto v = env.find("ENVCAST_STRICT")) {
        auto b = parse_bool("ENVCAST_STRICT", *v);
        if (b.is_err()) return std::move(b).error();
        s.strict = b.value();
        s.strict_set = true;
    }
    if (auto v = env.find("ENVCAST_LOG_LEVEL")) {
        auto lvl = log::parse_level(*v);
        if (lvl.is_err()) return std::move(lvl).error();
        s.log_level = lvl.value();
        s.log_level_set = true;
    }

    return Result<Settings>::ok(std::move(s));
}

void Settings::merge(const Settings& other) {
    if (!other.targets.empty()) targets = other.targets;
    if (!other.exclude.empty()) exclude = other.exclude;
    if (!other.policy.allow.empty()) policy.allow = other.policy.allow;
    if (!other.policy.allow_prefix.empty()) policy.allow_prefix = other.policy.allow_prefix;
    if (!other.command.empty()) command = other.command;

    // Scalars: other overrides only explicitly-set fields
    if (other.allow_all_set) {
        policy.allow_all = other.policy.allow_all;
        allow_all_set = true;
    }
    if (other.strict_set) {
        strict = other.strict;
        strict_set = true;
    }
    if (other.dry_run_set) {
        dry_run = other.dry_run;
        dry_run_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

Status Settings::validate() const {
    if (targets.empty()) {
        return EnvcastError{EnvcastError::Config, "no target globs configured",
            "pass --target, set ENVCAST_TARGET, or set [materialize].targets"};
    }
    for (const auto& pattern : targets) {
        ENVCAST_TRY(glob_validate(pattern));
    }
    for (const auto& name : policy.allow) {
        if (!is_identifier(name)) {
            return EnvcastError{EnvcastError::Config,
                "allow-listed name '" + name + "' is not a valid variable name",
                "names must match [A-Za-z_][A-Za-z0-9_]*"};
        }
    }
    if (!policy.allow_prefix.empty() && !is_identifier(policy.allow_prefix)) {
        return EnvcastError{EnvcastError::Config,
            "allow prefix '" + policy.allow_prefix + "' is not a valid identifier prefix"};
    }
    return ok_status();
}

} // namespace envcast
