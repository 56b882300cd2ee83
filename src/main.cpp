#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "commands/serve_command.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "lazyserve";
    constexpr const char *kVersionLine = "1.0.0";

    void printHelp()
    {
        std::cout << kAppName << " - rebuild on request, then serve\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " [options] [--] [COMMAND...]\n"
                  << "\n"
                  << "Options:\n"
                  << "  -p, --port PORT      Port to listen on (default 3000)\n"
                  << "  -H, --host HOST      Address to bind (default 0.0.0.0)\n"
                  << "  -s, --serve DIR      Directory to serve (default: current directory)\n"
                  << "  -w, --watch DIR      Tree checked for changes (default: current directory)\n"
                  << "  -i, --ignore PATH    Path excluded from change detection (repeatable)\n"
                  << "      --index FILE     File served for directories (default index.html)\n"
                  << "  -c, --config FILE    JSON file with defaults for the options above\n"
                  << "      --open           Open the browser once listening\n"
                  << "  -v, --verbose        Print scan timings and requests\n"
                  << "  -h, --help           Show this help\n"
                  << "      --version        Show version\n"
                  << "\n"
                  << "COMMAND runs through the shell whenever a page is requested and\n"
                  << "a file under the watched tree changed since the last good build.\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " -s _build/html -i _build make html\n"
                  << "  " << kAppName << " --port 8000 -- npm run build\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    const std::vector<std::string> args = collectArgs(argc, argv, 1);
    if (!args.empty())
    {
        const std::string &first = args.front();
        if (first == "--help" || first == "-h")
        {
            printHelp();
            return 0;
        }
        if (first == "--version")
        {
            std::cout << kAppName << " " << kVersionLine << '\n';
            return 0;
        }
    }

    const lazyserve::Context ctx(false);

    std::error_code ec;
    const fs::path workDir = fs::current_path(ec);
    if (ec)
    {
        ctx.error("Cannot determine current directory: ", ec.message());
        return 1;
    }

    return lazyserve::commands::runServeCommand(ctx, workDir, args);
}
