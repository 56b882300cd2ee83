#include "core/static_file_handler.hpp"

#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace lazyserve::core
{

    StaticFileHandler::StaticFileHandler(
        const lazyserve::Context &ctx,
        fs::path serveRoot,
        std::string indexFile,
        RebuildGate &gate)
        : ctx_(ctx),
          serveRoot_(std::move(serveRoot)),
          indexFile_(indexFile.empty() ? std::string("index.html") : std::move(indexFile)),
          gate_(gate)
    {
    }

    io::HttpResponse StaticFileHandler::handle(const io::HttpRequest &request) const
    {
        ctx_.debug(request.method, " ", request.target);

        if (request.method != "GET" && !request.isHead())
        {
            return io::HttpResponse::text(405, "Only GET/HEAD supported\n");
        }

        // HEAD never starts a build; it describes whatever is on disk.
        if (!request.isHead())
        {
            const std::optional<BuildFailure> failure = gate_.ensureFresh();
            if (failure)
            {
                // 200 so the browser renders the build log instead of its own error page.
                return io::HttpResponse::html(renderBuildFailureHtml(failure->message));
            }
        }

        return serveFile(request.target);
    }

    io::HttpResponse StaticFileHandler::serveFile(const std::string &target) const
    {
        fs::path relative;
        if (!io::sanitizeHttpRelativePath(target, indexFile_, relative))
        {
            return io::HttpResponse::text(403, "Forbidden\n");
        }

        fs::path file = serveRoot_ / relative;
        std::error_code ec;
        if (fs::is_directory(file, ec))
        {
            file /= indexFile_;
        }
        if (!fs::is_regular_file(file, ec))
        {
            return io::HttpResponse::text(404, "Not found\n");
        }

        // A symlink inside the root may still lead out of it.
        if (!io::isHttpPathSafe(file, serveRoot_))
        {
            return io::HttpResponse::text(403, "Forbidden\n");
        }

        const std::uintmax_t size = fs::file_size(file, ec);
        if (ec)
        {
            ctx_.warn("Cannot stat ", file.string(), ": ", ec.message());
            return io::HttpResponse::text(500, "Failed to read file size\n");
        }
        return io::HttpResponse::fromFile(file, size);
    }

    std::string renderBuildFailureHtml(const std::string &message)
    {
        return "<pre>" + io::htmlEscape(message) + "</pre>";
    }

} // namespace lazyserve::core
