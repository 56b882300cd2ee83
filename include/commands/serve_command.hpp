#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace lazyserve::commands {

int runServeCommand(
    const lazyserve::Context &ctx,
    const std::filesystem::path &workDir,
    const std::vector<std::string> &args
);

// Fills `spec` from an optional --config file and then the remaining options.
// Relative paths on the command line resolve against `workDir`.
bool parseServeOptions(
    const std::vector<std::string> &args,
    const std::filesystem::path &workDir,
    lazyserve::model::ServeSpec &spec,
    const lazyserve::Context &ctx
);

} // namespace lazyserve::commands
