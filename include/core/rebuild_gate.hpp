#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "core/context.hpp"
#include "io/fs_utils.hpp"
#include "io/process.hpp"

namespace lazyserve::core {

struct RebuildGateOptions {
    std::filesystem::path watchRoot;
    std::set<std::filesystem::path> ignoredPaths;
    std::string command;
};

struct BuildFailure {
    std::string message;
};

// Rebuilds the project when its fingerprint moved since the last successful
// build. The fingerprint is only advanced by a successful build, so a failing
// build is retried on every call until it passes or the tree changes again.
class RebuildGate {
public:
    using BuildRunner = std::function<io::BuildResult(const std::string &)>;

    static constexpr const char *kFailurePrefix = "Failed to build! Command output:\n\n";

    // An empty runner means io::runShellCommand.
    RebuildGate(const lazyserve::Context &ctx, RebuildGateOptions options, BuildRunner runner = {});

    RebuildGate(const RebuildGate &) = delete;
    RebuildGate &operator=(const RebuildGate &) = delete;

    // Scan, compare, and build if needed, all under one lock. std::nullopt
    // means the served tree is up to date.
    std::optional<BuildFailure> ensureFresh();

    std::optional<io::Fingerprint> lastKnownFingerprint() const;
    std::size_t buildCount() const;
    const RebuildGateOptions &options() const { return options_; }

private:
    const lazyserve::Context &ctx_;
    RebuildGateOptions options_;
    BuildRunner runner_;

    mutable std::mutex mutex_;
    std::optional<io::Fingerprint> lastKnown_;
    std::size_t buildCount_ = 0;
};

} // namespace lazyserve::core
