#include <envcast/env.hpp>
#include <envcast/log.hpp>
#include <cstring>

extern char** environ;

namespace envcast {

bool is_identifier_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

bool is_identifier(const std::string& name) {
    if (name.empty() || !is_identifier_start(name[0])) return false;
    for (char c : name) {
        if (!is_identifier_char(c)) return false;
    }
    return true;
}

EnvSnapshot EnvSnapshot::capture(char** envp) {
    Map vars;
    if (envp == nullptr) return EnvSnapshot(std::move(vars));

    size_t skipped = 0;
    for (char** entry = envp; *entry != nullptr; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (eq == nullptr) {
            skipped++;
            continue;
        }
        std::string name(*entry, static_cast<size_t>(eq - *entry));
        if (!is_identifier(name)) {
            skipped++;
            continue;
        }
        // First definition wins, like getenv()
        vars.emplace(std::move(name), std::string(eq + 1));
    }

    if (skipped > 0) {
        log::trace("skipped %zu environment entries with non-identifier names", skipped);
    }
    return EnvSnapshot(std::move(vars));
}

EnvSnapshot EnvSnapshot::capture_process() {
    return capture(environ);
}

Result<EnvSnapshot> EnvSnapshot::from_map(const Map& vars) {
    for (const auto& [name, value] : vars) {
        if (!is_identifier(name)) {
            return EnvcastError{EnvcastError::InvalidArg,
                "invalid variable name '" + name + "'",
                "names must match [A-Za-z_][A-Za-z0-9_]*"};
        }
    }
    return Result<EnvSnapshot>::ok(EnvSnapshot(vars));
}

const std::string* EnvSnapshot::find(const std::string& name) const {
    auto it = vars_.find(name);
    if (it == vars_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> EnvSnapshot::names() const {
    std::vector<std::string> out;
    out.reserve(vars_.size());
    for (const auto& kv : vars_) out.push_back(kv.first);
    return out;
}

EnvSnapshot EnvSnapshot::restrict_to(const std::vector<std::string>& names) const {
    Map out;
    for (const auto& name : names) {
        auto it = vars_.find(name);
        if (it == vars_.end()) {
            log::debug("allow-listed variable %s is not set", name.c_str());
            continue;
        }
        out.insert(*it);
    }
    return EnvSnapshot(std::move(out));
}

EnvSnapshot EnvSnapshot::restrict_to_prefix(const std::string& prefix) const {
    Map out;
    for (auto it = vars_.lower_bound(prefix); it != vars_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        out.insert(*it);
    }
    return EnvSnapshot(std::move(out));
}

EnvSnapshot EnvSnapshot::without_prefix(const std::string& prefix) const {
    Map out;
    for (const auto& kv : vars_) {
        if (kv.first.compare(0, prefix.size(), prefix) == 0) continue;
        out.insert(kv);
    }
    return EnvSnapshot(std::move(out));
}

EnvSnapshot EnvSnapshot::select(const EnvPolicy& policy) const {
    if (!policy.restricted()) return *this;

    Map out = restrict_to(policy.allow).vars_;
    if (!policy.allow_prefix.empty()) {
        for (const auto& kv : restrict_to_prefix(policy.allow_prefix).vars_) {
            out.insert(kv);
        }
    }
    return EnvSnapshot(std::move(out));
}

} // namespace envcast
