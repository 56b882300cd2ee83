#pragma once

#include <filesystem>
#include <optional>

#include "core/context.hpp"
#include "model/specs.hpp"

namespace lazyserve::model {

// Applies the keys of a JSON config file on top of `base`. Relative paths in
// the file resolve against the file's directory. Returns std::nullopt (after
// logging) when the file is missing or malformed.
std::optional<ServeSpec> loadServeFile(
    const std::filesystem::path &configFile,
    const ServeSpec &base,
    const lazyserve::Context &ctx
);

} // namespace lazyserve::model
