#pragma once

#include <envcast/env.hpp>
#include <envcast/result.hpp>
#include <string>
#include <vector>

namespace envcast {

struct MaterializeOptions {
    // Files matching any of these globs are left alone
    std::vector<std::string> exclude;
    // Unresolved placeholders become a NotFound error instead of pass-through
    bool strict = false;
    // Compute the report without writing anything
    bool dry_run = false;
};

struct FileReport {
    std::string path;
    size_t substitutions = 0;
    bool rewritten = false;
    std::vector<std::string> unresolved;
};

struct MaterializeReport {
    size_t files_matched = 0;     // matched by the target globs, before excludes
    size_t files_processed = 0;   // read and scanned
    size_t files_rewritten = 0;   // replaced on disk
    size_t substitutions = 0;
    std::vector<FileReport> files;
    // Sorted, unique names of placeholders that had no value
    std::vector<std::string> unresolved;
};

// Rewrite every file matching target_glob, replacing $NAME / ${NAME}
// placeholders with values from env. All files are read and expanded
// before the first one is written; any failure aborts the pass.
Result<MaterializeReport> materialize(const std::string& target_glob,
                                      const EnvSnapshot& env,
                                      const MaterializeOptions& opts = {});

// Same over several globs. A file matched by more than one glob is
// processed once.
Result<MaterializeReport> materialize_all(const std::vector<std::string>& target_globs,
                                          const EnvSnapshot& env,
                                          const MaterializeOptions& opts = {});

} // namespace envcast
