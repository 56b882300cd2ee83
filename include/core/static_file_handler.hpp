#pragma once

#include <filesystem>
#include <string>

#include "core/context.hpp"
#include "core/rebuild_gate.hpp"
#include "io/http_message.hpp"

namespace lazyserve::core {

// Answers requests from the serve directory, bringing the build up to date
// before every GET. Shared by all server workers.
class StaticFileHandler {
public:
    StaticFileHandler(
        const lazyserve::Context &ctx,
        std::filesystem::path serveRoot,
        std::string indexFile,
        RebuildGate &gate
    );

    io::HttpResponse handle(const io::HttpRequest &request) const;

    const std::filesystem::path &serveRoot() const { return serveRoot_; }

private:
    io::HttpResponse serveFile(const std::string &target) const;

    const lazyserve::Context &ctx_;
    std::filesystem::path serveRoot_;
    std::string indexFile_;
    RebuildGate &gate_;
};

// `<pre>` page shown in place of the requested file when the build fails.
std::string renderBuildFailureHtml(const std::string &message);

} // namespace lazyserve::core
