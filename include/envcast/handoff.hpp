#pragma once

#include <envcast/result.hpp>
#include <string>
#include <vector>

namespace envcast {

// Replace the current process image with argv[0] (looked up on PATH).
// The server inherits the environment, open descriptors and PID, so it
// becomes the container's main process. Returns only on failure.
Status exec_server(const std::vector<std::string>& argv);

// Render argv for log output: arguments with spaces or quotes are quoted.
std::string describe_command(const std::vector<std::string>& argv);

} // namespace envcast
