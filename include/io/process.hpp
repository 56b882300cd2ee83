#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace lazyserve::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    long long processId = -1;
};

// Outcome of a shell build command. A failing build is a normal result,
// never an exception.
struct BuildResult {
    std::string output; // stdout and stderr, interleaved
    bool succeeded = false;
    int exitStatus = -1;
};

std::string shellQuote(const std::string &value);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const lazyserve::Context &ctx
);

// Runs `command` through the system shell with stderr merged into stdout and
// blocks until it exits. No timeout.
BuildResult runShellCommand(const std::string &command, const lazyserve::Context &ctx);

} // namespace lazyserve::io
