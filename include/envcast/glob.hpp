#pragma once

#include <envcast/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace envcast {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True if the pattern contains *, ? or [.
bool glob_has_wildcard(const std::string& pattern);

// Reject empty patterns, unclosed or empty character classes, and
// negated ('!') patterns. Returns a Config error describing the problem.
Status glob_validate(const std::string& pattern);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// A pattern split into its literal leading directory and the wildcard rest,
// e.g. "/srv/html/**/*.js" -> {"/srv/html", "**/*.js"}.
struct GlobBase {
    std::filesystem::path base;
    std::string rest;
    bool implicit_base = false;  // base is "." only because the pattern is relative
};

GlobBase glob_split_base(const std::string& pattern);

// Validate and expand a pattern against the filesystem.
// Returns the matching regular files in lexicographic order. A base
// directory that does not exist gives an empty list, not an error.
Result<std::vector<std::string>> glob_expand_pattern(const std::string& pattern);

// Apply ordered include/exclude patterns to a list of paths.
// Patterns prefixed with '!' exclude; others include.
// Returns paths that match at least one include and no subsequent exclude.
std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths);

} // namespace envcast
