#pragma once

#include <string>

namespace envcast {

struct EnvcastError {
    enum Code {
        IO,
        Config,
        Parse,
        NotFound,
        InvalidArg,
        Exec
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;

    EnvcastError() = default;
    EnvcastError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    EnvcastError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    EnvcastError(Code c, std::string msg, std::string h, std::string f)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// Build an IO error from errno, e.g. "cannot open: Permission denied".
EnvcastError io_error_from_errno(const std::string& what,
                                 const std::string& path,
                                 int err);

} // namespace envcast
