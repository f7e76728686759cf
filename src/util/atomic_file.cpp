#include <envcast/atomic_file.hpp>
#include <envcast/log.hpp>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace envcast {

namespace fs = std::filesystem;

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        int err = errno != 0 ? errno : EIO;
        return io_error_from_errno("cannot open file for reading", path, err);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return EnvcastError{EnvcastError::IO, "error while reading file", "", path};
    }
    return Result<std::string>::ok(buf.str());
}

bool is_staging_name(const std::string& filename) {
    if (filename.empty() || filename[0] != '.') return false;
    auto pos = filename.rfind(kStagingMarker);
    if (pos == std::string::npos) return false;
    // mkstemp replaces exactly six X's
    return filename.size() - pos == std::char_traits<char>::length(kStagingMarker) + 6;
}

static Status write_all(int fd, const std::string& contents, const std::string& path) {
    const char* p = contents.data();
    size_t left = contents.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return io_error_from_errno("cannot write temporary file", path, errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return ok_status();
}

Result<StagedFile> StagedFile::stage(const std::string& target, const std::string& contents) {
    fs::path tgt(target);
    fs::path dir = tgt.parent_path();
    if (dir.empty()) dir = ".";

    std::string tmpl = (dir / ("." + tgt.filename().string() + kStagingMarker + "XXXXXX")).string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        return io_error_from_errno("cannot create temporary file", tmpl, errno);
    }
    // Owned from here on: the destructor unlinks it unless committed
    StagedFile staged(target, std::string(name.data()));

    auto fail = [&](const char* what, int err) -> Result<StagedFile> {
        ::close(fd);
        return io_error_from_errno(what, staged.temp_, err);
    };

    auto st = write_all(fd, contents, staged.temp_);
    if (st.is_err()) {
        ::close(fd);
        return std::move(st).error();
    }

    // Keep the target's permissions; mkstemp creates 0600
    struct stat orig;
    if (::stat(target.c_str(), &orig) == 0) {
        if (::fchmod(fd, orig.st_mode & 07777) != 0) {
            return fail("cannot set permissions on temporary file", errno);
        }
        if (::geteuid() == 0 && ::fchown(fd, orig.st_uid, orig.st_gid) != 0) {
            return fail("cannot set owner on temporary file", errno);
        }
    } else if (errno == ENOENT) {
        mode_t mask = ::umask(0);
        ::umask(mask);
        if (::fchmod(fd, 0666 & ~mask) != 0) {
            return fail("cannot set permissions on temporary file", errno);
        }
    } else {
        return fail("cannot stat target file", errno);
    }

    if (::fsync(fd) != 0) {
        return fail("cannot flush temporary file", errno);
    }
    if (::close(fd) != 0) {
        return io_error_from_errno("cannot close temporary file", staged.temp_, errno);
    }

    log::trace("staged %zu bytes at %s", contents.size(), staged.temp_.c_str());
    return Result<StagedFile>::ok(std::move(staged));
}

StagedFile::StagedFile(StagedFile&& other) noexcept
    : target_(std::move(other.target_)),
      temp_(std::move(other.temp_)),
      committed_(other.committed_) {
    other.temp_.clear();
    other.committed_ = true;
}

StagedFile& StagedFile::operator=(StagedFile&& other) noexcept {
    if (this != &other) {
        discard();
        target_ = std::move(other.target_);
        temp_ = std::move(other.temp_);
        committed_ = other.committed_;
        other.temp_.clear();
        other.committed_ = true;
    }
    return *this;
}

StagedFile::~StagedFile() {
    discard();
}

void StagedFile::discard() {
    if (committed_ || temp_.empty()) return;
    if (::unlink(temp_.c_str()) != 0 && errno != ENOENT) {
        log::warn("cannot remove temporary file %s", temp_.c_str());
    }
    temp_.clear();
}

Status StagedFile::commit() {
    if (committed_) {
        return EnvcastError{EnvcastError::InvalidArg,
            "staged file already committed", "", target_};
    }
    if (::rename(temp_.c_str(), target_.c_str()) != 0) {
        int err = errno;
        discard();
        return io_error_from_errno("cannot rename temporary file into place", target_, err);
    }
    committed_ = true;

    // Persist the rename itself
    fs::path dir = fs::path(target_).parent_path();
    if (dir.empty()) dir = ".";
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd >= 0) {
        if (::fsync(dfd) != 0) {
            log::debug("fsync of directory %s failed", dir.c_str());
        }
        ::close(dfd);
    }
    return ok_status();
}

Status write_file_atomic(const std::string& path, const std::string& contents) {
    auto staged = StagedFile::stage(path, contents);
    if (staged.is_err()) return std::move(staged).error();
    return staged.value().commit();
}

} // namespace envcast
