#pragma once

#include <envcast/env.hpp>
#include <envcast/result.hpp>
#include <string>
#include <vector>

namespace envcast {

struct ExpandResult {
    std::string text;
    size_t substitutions = 0;
    // Names of placeholders left in place, in order of first appearance
    std::vector<std::string> unresolved;
};

// Substitute $NAME and ${NAME} placeholders whose NAME is in env.
// Values are inserted literally and never rescanned. Placeholders for
// names not in env, and anything that is not a well-formed placeholder,
// are copied through unchanged. Never returns an error.
ExpandResult expand_placeholders(const std::string& text, const EnvSnapshot& env);

// Strict substitution: returns NotFound on the first unresolved placeholder.
Result<std::string> expand_placeholders_strict(const std::string& text,
                                               const EnvSnapshot& env);

} // namespace envcast
