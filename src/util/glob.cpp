#include <envcast/glob.hpp>
#include <envcast/log.hpp>
#include <algorithm>
#include <system_error>

namespace envcast {

namespace fs = std::filesystem;

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Drop a leading "./" so relative patterns and paths line up
    while (out.size() > 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static bool segment_has_wildcard(const std::string& seg) {
    return seg.find_first_of("*?[") != std::string::npos;
}

// Match a single segment against a pattern segment (no '/' in either).
// Supports *, ?, [abc], [a-z], [!...].
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            pi++;
            // Consecutive stars in a single segment collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++; // skip '['
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    // Consume trailing stars in pattern
    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    // Consume trailing '**' in pattern
    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    auto pat_segs = split_segments(normalize_path(pattern));
    auto path_segs = split_segments(normalize_path(path));
    return match_segments(pat_segs, 0, path_segs, 0);
}

bool glob_has_wildcard(const std::string& pattern) {
    return segment_has_wildcard(pattern);
}

Status glob_validate(const std::string& pattern) {
    if (pattern.empty()) {
        return EnvcastError{EnvcastError::Config, "target glob is empty",
            "pass a pattern such as /usr/share/nginx/html/**/*.js"};
    }
    if (pattern[0] == '!') {
        return EnvcastError{EnvcastError::Config,
            "target glob '" + pattern + "' is a negation",
            "use --exclude to remove files from the target set"};
    }
    if (pattern.find('\0') != std::string::npos) {
        return EnvcastError{EnvcastError::Config,
            "target glob contains a NUL byte"};
    }

    for (size_t i = 0; i < pattern.size(); i++) {
        if (pattern[i] != '[') continue;
        size_t j = i + 1;
        if (j < pattern.size() && pattern[j] == '!') j++;
        size_t first = j;
        while (j < pattern.size() && pattern[j] != ']' && pattern[j] != '/') j++;
        if (j >= pattern.size() || pattern[j] != ']') {
            return EnvcastError{EnvcastError::Config,
                "unclosed '[' in target glob '" + pattern + "' at position "
                    + std::to_string(i)};
        }
        if (j == first) {
            return EnvcastError{EnvcastError::Config,
                "empty character class in target glob '" + pattern + "' at position "
                    + std::to_string(i)};
        }
        i = j;
    }
    return ok_status();
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

GlobBase glob_split_base(const std::string& pattern) {
    auto norm = normalize_path(pattern);
    auto segs = split_segments(norm);

    // Everything before the first wildcard segment is literal directory.
    // The last segment always stays in `rest`.
    size_t literal = 0;
    while (literal + 1 < segs.size() && !segment_has_wildcard(segs[literal])) {
        literal++;
    }

    GlobBase gb;
    std::string base;
    for (size_t i = 0; i < literal; i++) {
        if (i > 0) base += '/';
        base += segs[i];
    }
    if (literal > 0 && base.empty()) base = "/";   // pattern was "/<rest>"

    for (size_t i = literal; i < segs.size(); i++) {
        if (i > literal) gb.rest += '/';
        gb.rest += segs[i];
    }

    if (base.empty()) {
        gb.base = ".";
        gb.implicit_base = true;
    } else {
        gb.base = base;
    }
    return gb;
}

// Only a missing path means "no matches"; any other stat failure is fatal
static bool is_missing(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory ||
           ec == std::errc::not_a_directory;
}

Result<std::vector<std::string>> glob_expand_pattern(const std::string& pattern) {
    ENVCAST_TRY(glob_validate(pattern));

    std::vector<std::string> results;
    std::error_code ec;

    if (!glob_has_wildcard(pattern)) {
        bool regular = fs::is_regular_file(pattern, ec);
        if (ec && !is_missing(ec)) {
            return EnvcastError{EnvcastError::IO,
                "cannot stat target: " + ec.message(), "", pattern};
        }
        if (regular) {
            results.push_back(normalize_path(pattern));
        }
        return Result<std::vector<std::string>>::ok(std::move(results));
    }

    auto gb = glob_split_base(pattern);
    bool is_dir = fs::is_directory(gb.base, ec);
    if (ec && !is_missing(ec)) {
        return EnvcastError{EnvcastError::IO,
            "cannot stat glob base directory: " + ec.message(), "", gb.base.string()};
    }
    if (!is_dir) {
        log::warn("glob base directory does not exist: %s", gb.base.c_str());
        return Result<std::vector<std::string>>::ok(std::move(results));
    }

    // Without '**' there is no need to descend past the pattern's depth
    auto rest_segs = split_segments(gb.rest);
    bool unbounded = std::find(rest_segs.begin(), rest_segs.end(), "**") != rest_segs.end();
    int max_depth = static_cast<int>(rest_segs.size()) - 1;

    fs::recursive_directory_iterator it(gb.base, ec);
    if (ec) {
        return EnvcastError{EnvcastError::IO,
            "cannot read directory: " + ec.message(), "", gb.base.string()};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return EnvcastError{EnvcastError::IO,
                "error iterating directory: " + ec.message(), "", gb.base.string()};
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec) && !unbounded && it.depth() >= max_depth) {
            it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(entry_ec)) continue;

        auto rel = entry.path().lexically_relative(gb.base).generic_string();
        if (!glob_match(gb.rest, rel)) continue;

        if (gb.implicit_base) {
            results.push_back(rel);
        } else {
            results.push_back(normalize_path(gb.base.generic_string() + "/" + rel));
        }
    }
    if (ec) {
        return EnvcastError{EnvcastError::IO,
            "error iterating directory: " + ec.message(), "", gb.base.string()};
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths)
{
    std::vector<std::string> result;

    for (const auto& path : paths) {
        bool included = false;
        // Last matching pattern wins
        for (const auto& pat : patterns) {
            std::string inner;
            if (glob_is_negation(pat, inner)) {
                if (glob_match(inner, path)) included = false;
            } else {
                if (glob_match(pat, path)) included = true;
            }
        }
        if (included) result.push_back(path);
    }

    return result;
}

} // namespace envcast
