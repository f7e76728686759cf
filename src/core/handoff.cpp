#include <envcast/handoff.hpp>
#include <envcast/log.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <unistd.h>

namespace envcast {

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        bool plain = !arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos;
        if (plain) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}

Status exec_server(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0].empty()) {
        return EnvcastError{EnvcastError::InvalidArg, "no server command given",
            "pass the server after '--', e.g. -- nginx -g 'daemon off;'"};
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    log::info("handing off to: %s", describe_command(argv).c_str());
    // Anything buffered would otherwise be lost with the process image
    std::fflush(stdout);
    std::fflush(stderr);

    ::execvp(cargv[0], cargv.data());

    int err = errno;
    return EnvcastError{EnvcastError::Exec,
        "cannot execute '" + argv[0] + "': " + std::strerror(err),
        err == ENOENT ? "the command was not found on PATH" : ""};
}

} // namespace envcast
