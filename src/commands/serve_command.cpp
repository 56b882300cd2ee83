#include "commands/serve_command.hpp"

#include <csignal>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/rebuild_gate.hpp"
#include "core/static_file_handler.hpp"
#include "io/fs_utils.hpp"
#include "io/http_server.hpp"
#include "io/process.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace lazyserve::commands
{
    namespace
    {

        void handleStopSignal(int)
        {
            lazyserve::io::stopHttpServer();
        }

        void tryOpenBrowser(const lazyserve::Context &ctx, const std::string &url)
        {
#ifdef _WIN32
            lazyserve::io::runCommand("cmd", {"/c", "start", "", url}, {}, ctx);
#elif __APPLE__
            lazyserve::io::runCommand("open", {url}, {}, ctx);
#else
            lazyserve::io::runCommand("xdg-open", {url}, {}, ctx);
#endif
        }

        fs::path resolveCliPath(const fs::path &workDir, const std::string &value)
        {
            fs::path path(value);
            if (path.is_absolute())
            {
                return path;
            }
            return (workDir / path).lexically_normal();
        }

        bool takeValue(
            const std::vector<std::string> &args,
            std::size_t &i,
            std::string &out,
            const lazyserve::Context &ctx)
        {
            if (i + 1 >= args.size())
            {
                ctx.error(args[i], " requires value");
                return false;
            }
            out = args[++i];
            return true;
        }

        // The config file is read before any other option so the command
        // line always wins over it.
        std::optional<std::string> findConfigOption(const std::vector<std::string> &args)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--")
                {
                    break;
                }
                if ((arg == "-c" || arg == "--config") && i + 1 < args.size())
                {
                    return args[i + 1];
                }
            }
            return std::nullopt;
        }

        std::string joinCommand(const std::vector<std::string> &words)
        {
            std::string out;
            for (const auto &word : words)
            {
                if (!out.empty())
                {
                    out.push_back(' ');
                }
                out += word;
            }
            return out;
        }

    } // namespace

    bool parseServeOptions(
        const std::vector<std::string> &args,
        const fs::path &workDir,
        lazyserve::model::ServeSpec &spec,
        const lazyserve::Context &ctx)
    {
        spec.serveDir = workDir;
        spec.watchDir = workDir;

        if (const auto configFile = findConfigOption(args))
        {
            auto loaded = lazyserve::model::loadServeFile(resolveCliPath(workDir, *configFile), spec, ctx);
            if (!loaded.has_value())
            {
                return false;
            }
            spec = std::move(*loaded);
        }

        std::vector<std::string> commandWords;
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            std::string value;

            // Everything from the first positional on is the build command.
            if (!commandWords.empty())
            {
                commandWords.push_back(arg);
                continue;
            }
            if (arg == "--")
            {
                commandWords.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
                break;
            }

            if (arg == "-p" || arg == "--port")
            {
                if (!takeValue(args, i, value, ctx))
                {
                    return false;
                }
                try
                {
                    std::size_t used = 0;
                    spec.port = std::stoi(value, &used);
                    if (used != value.size())
                    {
                        throw std::invalid_argument(value);
                    }
                }
                catch (const std::exception &)
                {
                    ctx.error("Invalid --port value: ", value);
                    return false;
                }
                continue;
            }
            if (arg == "-H" || arg == "--host")
            {
                if (!takeValue(args, i, spec.host, ctx))
                {
                    return false;
                }
                continue;
            }
            if (arg == "-i" || arg == "--ignore")
            {
                if (!takeValue(args, i, value, ctx))
                {
                    return false;
                }
                spec.ignore.push_back(resolveCliPath(workDir, value));
                continue;
            }
            if (arg == "-s" || arg == "--serve")
            {
                if (!takeValue(args, i, value, ctx))
                {
                    return false;
                }
                spec.serveDir = resolveCliPath(workDir, value);
                continue;
            }
            if (arg == "-w" || arg == "--watch")
            {
                if (!takeValue(args, i, value, ctx))
                {
                    return false;
                }
                spec.watchDir = resolveCliPath(workDir, value);
                continue;
            }
            if (arg == "--index")
            {
                if (!takeValue(args, i, spec.indexFile, ctx))
                {
                    return false;
                }
                continue;
            }
            if (arg == "-c" || arg == "--config")
            {
                if (!takeValue(args, i, value, ctx))
                {
                    return false;
                }
                continue;
            }
            if (arg == "--open")
            {
                spec.openBrowser = true;
                continue;
            }
            if (arg == "--no-open")
            {
                spec.openBrowser = false;
                continue;
            }
            if (arg == "-v" || arg == "--verbose")
            {
                spec.verbose = true;
                continue;
            }

            if (arg.size() > 1 && arg.front() == '-')
            {
                ctx.error("Unknown option: ", arg);
                return false;
            }
            commandWords.push_back(arg);
        }

        if (!commandWords.empty())
        {
            spec.command = joinCommand(commandWords);
        }

        if (spec.port <= 0 || spec.port > 65535)
        {
            ctx.error("Port out of range: ", spec.port);
            return false;
        }
        return true;
    }

    int runServeCommand(const lazyserve::Context &ctx, const fs::path &workDir, const std::vector<std::string> &args)
    {
        lazyserve::model::ServeSpec spec;
        if (!parseServeOptions(args, workDir, spec, ctx))
        {
            return 1;
        }

        const lazyserve::Context serveCtx(spec.verbose);

        std::error_code ec;
        if (!fs::is_directory(spec.serveDir, ec))
        {
            serveCtx.error("Serve directory not found: ", spec.serveDir.string());
            return 1;
        }
        if (!fs::is_directory(spec.watchDir, ec))
        {
            serveCtx.error("Watch directory not found: ", spec.watchDir.string());
            return 1;
        }

        lazyserve::core::RebuildGateOptions gateOptions;
        gateOptions.watchRoot = lazyserve::io::normalizeIgnoredPath(spec.watchDir, workDir);
        gateOptions.command = spec.command;
        for (const auto &path : spec.ignore)
        {
            const fs::path normal = lazyserve::io::normalizeIgnoredPath(path, workDir);
            serveCtx.debug("Ignoring ", normal.string());
            gateOptions.ignoredPaths.insert(normal);
        }

        const fs::path serveRoot = lazyserve::io::normalizeIgnoredPath(spec.serveDir, workDir);
        if (serveRoot != gateOptions.watchRoot && lazyserve::io::isPathInside(serveRoot, gateOptions.watchRoot))
        {
            bool covered = false;
            for (const auto &ignored : gateOptions.ignoredPaths)
            {
                covered = covered || lazyserve::io::isPathInside(serveRoot, ignored);
            }
            if (!covered)
            {
                serveCtx.warn("Serve directory ", serveRoot.string(),
                              " is watched; build output will trigger rebuilds. Consider --ignore ", serveRoot.string());
            }
        }

        if (!lazyserve::io::isHttpPortAvailable(serveCtx, spec.host, spec.port))
        {
            serveCtx.error("Port ", spec.port, " is not available on ", spec.host);
            return 1;
        }

        lazyserve::core::RebuildGate gate(serveCtx, std::move(gateOptions));
        const lazyserve::core::StaticFileHandler handler(serveCtx, serveRoot, spec.indexFile, gate);

        lazyserve::io::HttpServerOptions serverOpt;
        serverOpt.host = spec.host;
        serverOpt.port = spec.port;

        serveCtx.log("Build command: ", spec.command.empty() ? std::string("(none)") : spec.command);
        serveCtx.log("Watching: ", gate.options().watchRoot.string());
        serveCtx.log("Serve root: ", handler.serveRoot().string());

        if (spec.openBrowser)
        {
            const std::string browseHost = spec.host == "0.0.0.0" ? std::string("localhost") : spec.host;
            tryOpenBrowser(serveCtx, "http://" + browseHost + ":" + std::to_string(spec.port) + "/");
        }

        lazyserve::io::armHttpServer();
        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        const bool served = lazyserve::io::serveHttp(serveCtx, serverOpt, [&handler](const lazyserve::io::HttpRequest &request)
                                                     { return handler.handle(request); });

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        return served ? 0 : 1;
    }

} // namespace lazyserve::commands
