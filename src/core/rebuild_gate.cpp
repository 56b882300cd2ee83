#include "core/rebuild_gate.hpp"

#include <chrono>
#include <utility>

namespace lazyserve::core
{
    namespace
    {

        long long elapsedMs(std::chrono::steady_clock::time_point since)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - since)
                .count();
        }

    } // namespace

    RebuildGate::RebuildGate(const lazyserve::Context &ctx, RebuildGateOptions options, BuildRunner runner)
        : ctx_(ctx), options_(std::move(options)), runner_(std::move(runner))
    {
        if (!runner_)
        {
            runner_ = [this](const std::string &command)
            {
                return io::runShellCommand(command, ctx_);
            };
        }
    }

    std::optional<BuildFailure> RebuildGate::ensureFresh()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto scanStart = std::chrono::steady_clock::now();
        const io::Fingerprint current = io::computeFingerprint(options_.watchRoot, options_.ignoredPaths, ctx_);
        ctx_.debug("Scanned ", options_.watchRoot.string(), " in ", elapsedMs(scanStart), " ms");

        if (lastKnown_.has_value() && *lastKnown_ == current)
        {
            return std::nullopt;
        }

        ctx_.log("Rebuilding: ", options_.command.empty() ? std::string("(empty command)") : options_.command);
        const auto buildStart = std::chrono::steady_clock::now();
        ++buildCount_;
        io::BuildResult result = runner_(options_.command);

        if (!result.succeeded)
        {
            ctx_.warn("Build failed (exit ", result.exitStatus, ") in ", elapsedMs(buildStart), " ms");
            return BuildFailure{kFailurePrefix + result.output};
        }

        ctx_.log("Build succeeded in ", elapsedMs(buildStart), " ms");
        lastKnown_ = current;
        return std::nullopt;
    }

    std::optional<io::Fingerprint> RebuildGate::lastKnownFingerprint() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastKnown_;
    }

    std::size_t RebuildGate::buildCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return buildCount_;
    }

} // namespace lazyserve::core
