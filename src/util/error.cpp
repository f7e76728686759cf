#include <envcast/error.hpp>
#include <cerrno>
#include <cstring>

namespace envcast {

const char* EnvcastError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Config:     return "Config";
        case Parse:      return "Parse";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case Exec:       return "Exec";
    }
    return "Unknown";
}

std::string EnvcastError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
    }

    return result;
}

EnvcastError io_error_from_errno(const std::string& what,
                                 const std::string& path,
                                 int err) {
    std::string hint;
    if (err == EACCES || err == EPERM) {
        hint = "check that the container user can write the target directory";
    } else if (err == ENOSPC || err == EDQUOT) {
        hint = "the filesystem holding the bundle is full";
    } else if (err == EROFS) {
        hint = "the bundle directory is mounted read-only";
    }
    return EnvcastError{EnvcastError::IO,
        what + ": " + std::strerror(err), std::move(hint), path};
}

} // namespace envcast
