#pragma once

#include <envcast/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace envcast {

// [A-Za-z_]
bool is_identifier_start(char c);
// [A-Za-z0-9_]
bool is_identifier_char(char c);
// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(const std::string& name);

// Which environment variables may be substituted into served files.
// With nothing configured the whole (filtered) environment is used.
struct EnvPolicy {
    std::vector<std::string> allow;
    std::string allow_prefix;
    bool allow_all = false;

    bool restricted() const { return !allow_all && (!allow.empty() || !allow_prefix.empty()); }
    bool configured() const { return allow_all || !allow.empty() || !allow_prefix.empty(); }
};

// Immutable name -> value mapping captured once at startup.
// Only entries with identifier names are kept.
class EnvSnapshot {
public:
    using Map = std::map<std::string, std::string>;

    EnvSnapshot() = default;

    // Parse a NULL-terminated array of "NAME=value" strings.
    static EnvSnapshot capture(char** envp);

    // Capture the current process environment.
    static EnvSnapshot capture_process();

    // Build from an explicit mapping. Fails on a non-identifier name.
    static Result<EnvSnapshot> from_map(const Map& vars);

    const std::string* find(const std::string& name) const;
    bool contains(const std::string& name) const { return vars_.count(name) > 0; }
    size_t size() const { return vars_.size(); }
    bool empty() const { return vars_.empty(); }
    const Map& vars() const { return vars_; }
    std::vector<std::string> names() const;

    EnvSnapshot restrict_to(const std::vector<std::string>& names) const;
    EnvSnapshot restrict_to_prefix(const std::string& prefix) const;
    EnvSnapshot without_prefix(const std::string& prefix) const;

    // Apply an allow policy: union of listed names and prefix matches,
    // or everything when allow_all is set or nothing is configured.
    EnvSnapshot select(const EnvPolicy& policy) const;

private:
    explicit EnvSnapshot(Map vars) : vars_(std::move(vars)) {}

    Map vars_;
};

} // namespace envcast
