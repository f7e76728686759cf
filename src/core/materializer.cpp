#include <envcast/materializer.hpp>
#include <envcast/atomic_file.hpp>
#include <envcast/expand.hpp>
#include <envcast/glob.hpp>
#include <envcast/log.hpp>

#include <algorithm>
#include <filesystem>
#include <set>
#include <unordered_set>

namespace envcast {

namespace fs = std::filesystem;

// A file read and expanded, waiting to be written
struct PendingFile {
    FileReport report;
    std::string contents;
};

static Result<std::vector<std::string>> collect_targets(
    const std::vector<std::string>& target_globs,
    const std::vector<std::string>& exclude,
    size_t& matched)
{
    std::vector<std::string> paths;
    std::unordered_set<std::string> seen;

    for (const auto& pattern : target_globs) {
        auto expanded = glob_expand_pattern(pattern);
        if (expanded.is_err()) return std::move(expanded).error();

        if (expanded.value().empty()) {
            log::info("target glob '%s' matched no files", pattern.c_str());
        }
        for (auto& p : expanded.value()) {
            if (seen.insert(p).second) paths.push_back(std::move(p));
        }
    }
    matched = paths.size();

    if (!exclude.empty()) {
        std::vector<std::string> patterns = {"**"};
        for (const auto& ex : exclude) patterns.push_back("!" + ex);
        paths = glob_filter(patterns, paths);
    }

    paths.erase(std::remove_if(paths.begin(), paths.end(), [](const std::string& p) {
        if (!is_staging_name(fs::path(p).filename().string())) return false;
        log::warn("ignoring leftover temporary file %s", p.c_str());
        return true;
    }), paths.end());

    return Result<std::vector<std::string>>::ok(std::move(paths));
}

static Result<PendingFile> expand_file(const std::string& path,
                                       const EnvSnapshot& env,
                                       bool strict) {
    auto contents = read_file(path);
    if (contents.is_err()) return std::move(contents).error();

    auto expanded = expand_placeholders(contents.value(), env);

    if (strict && !expanded.unresolved.empty()) {
        std::string names;
        for (const auto& n : expanded.unresolved) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        return EnvcastError{EnvcastError::NotFound,
            "unresolved placeholders: " + names,
            "set the variables or allow-list them, or drop --strict",
            path};
    }

    PendingFile pending;
    pending.report.path = path;
    pending.report.substitutions = expanded.substitutions;
    pending.report.unresolved = std::move(expanded.unresolved);
    pending.contents = std::move(expanded.text);
    return Result<PendingFile>::ok(std::move(pending));
}

Result<MaterializeReport> materialize_all(const std::vector<std::string>& target_globs,
                                          const EnvSnapshot& env,
                                          const MaterializeOptions& opts) {
    if (target_globs.empty()) {
        return EnvcastError{EnvcastError::Config, "no target globs given",
            "pass --target or set [materialize].targets"};
    }
    // Reject bad patterns before touching the filesystem
    for (const auto& pattern : target_globs) {
        ENVCAST_TRY(glob_validate(pattern));
    }
    for (const auto& pattern : opts.exclude) {
        if (pattern.empty()) {
            return EnvcastError{EnvcastError::Config, "exclude glob is empty"};
        }
    }

    MaterializeReport report;
    auto targets = collect_targets(target_globs, opts.exclude, report.files_matched);
    if (targets.is_err()) return std::move(targets).error();

    // Phase 1: read and expand everything
    std::vector<PendingFile> pending;
    pending.reserve(targets.value().size());
    for (const auto& path : targets.value()) {
        auto file = expand_file(path, env, opts.strict);
        if (file.is_err()) return std::move(file).error();
        log::debug("%s: %zu substitution(s)", path.c_str(), file.value().report.substitutions);
        pending.push_back(std::move(file).value());
    }

    // Phase 2: write files that changed
    std::set<std::string> unresolved;
    for (auto& file : pending) {
        report.files_processed++;
        report.substitutions += file.report.substitutions;
        unresolved.insert(file.report.unresolved.begin(), file.report.unresolved.end());

        if (file.report.substitutions > 0 && !opts.dry_run) {
            auto st = write_file_atomic(file.report.path, file.contents);
            if (st.is_err()) return std::move(st).error();
            file.report.rewritten = true;
            report.files_rewritten++;
        }
        report.files.push_back(std::move(file.report));
    }
    report.unresolved.assign(unresolved.begin(), unresolved.end());

    for (const auto& name : report.unresolved) {
        log::warn("placeholder $%s has no value and was left in place", name.c_str());
    }
    log::info("%s%zu file(s) processed, %zu rewritten, %zu substitution(s)",
              opts.dry_run ? "dry run: " : "",
              report.files_processed, report.files_rewritten, report.substitutions);

    return Result<MaterializeReport>::ok(std::move(report));
}

Result<MaterializeReport> materialize(const std::string& target_glob,
                                      const EnvSnapshot& env,
                                      const MaterializeOptions& opts) {
    return materialize_all(std::vector<std::string>{target_glob}, env, opts);
}

} // namespace envcast
