#include <envcast/cli.hpp>
#include <envcast/env.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv) {
    // Snapshot once: nothing below reads the environment directly
    auto env = envcast::EnvSnapshot::capture_process();
    std::vector<std::string> args(argv + 1, argv + argc);
    return envcast::run_app(args, env);
}
