#pragma once

#include <envcast/result.hpp>
#include <string>

namespace envcast {

// Read a whole file as bytes.
Result<std::string> read_file(const std::string& path);

// Suffix marker used for staging files: ".<name>.envcast-XXXXXX"
constexpr const char* kStagingMarker = ".envcast-";

// True if a file name looks like one of our staging files. Stale ones can
// be left behind by a crash between stage() and commit().
bool is_staging_name(const std::string& filename);

// New contents written next to their target, not yet visible.
// The temp file lives in the target's directory so rename() stays on one
// filesystem. Destroying an uncommitted StagedFile removes the temp file
// and leaves the target untouched.
class StagedFile {
public:
    static Result<StagedFile> stage(const std::string& target, const std::string& contents);

    StagedFile(StagedFile&& other) noexcept;
    StagedFile& operator=(StagedFile&& other) noexcept;
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;
    ~StagedFile();

    // Atomically replace the target with the staged contents.
    Status commit();

    const std::string& target_path() const { return target_; }
    const std::string& temp_path() const { return temp_; }
    bool committed() const { return committed_; }

private:
    StagedFile(std::string target, std::string temp)
        : target_(std::move(target)), temp_(std::move(temp)) {}

    void discard();

    std::string target_;
    std::string temp_;
    bool committed_ = false;
};

// stage() followed by commit().
Status write_file_atomic(const std::string& path, const std::string& contents);

} // namespace envcast
