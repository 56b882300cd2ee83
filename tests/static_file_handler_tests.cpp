#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/rebuild_gate.hpp"
#include "core/static_file_handler.hpp"

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path root = fs::temp_directory_path() / ("lazyserve_handler_test_" + name + "_" + std::to_string(now));
        fs::create_directories(root);
        return fs::canonical(root);
    }

    void writeText(const fs::path &file, const std::string &text)
    {
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << text;
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    lazyserve::io::HttpRequest request(const std::string &method, const std::string &target)
    {
        lazyserve::io::HttpRequest out;
        out.method = method;
        out.target = target;
        return out;
    }

    // A site directory plus a gate whose build outcome the test controls.
    struct Site
    {
        explicit Site(const std::string &name, bool buildSucceeds = true)
            : root(makeTempRoot(name)),
              ok(buildSucceeds)
        {
            writeText(root / "index.html", "<h1>home</h1>");
            writeText(root / "docs" / "index.html", "<h1>docs</h1>");
            writeText(root / "app.js", "console.log(1);");

            lazyserve::core::RebuildGateOptions options;
            options.watchRoot = root;
            options.command = "make site";
            auto runner = [this](const std::string &)
            {
                ++builds;
                lazyserve::io::BuildResult result;
                result.succeeded = ok;
                result.exitStatus = ok ? 0 : 2;
                result.output = ok ? "" : "site.c:1: error: a < b\n";
                return result;
            };
            gate = std::make_unique<lazyserve::core::RebuildGate>(ctx, options, runner);
            handler = std::make_unique<lazyserve::core::StaticFileHandler>(ctx, root, "index.html", *gate);
        }

        ~Site()
        {
            cleanupTemp(root);
        }

        const lazyserve::Context ctx{false};
        fs::path root;
        bool ok;
        int builds = 0;
        std::unique_ptr<lazyserve::core::RebuildGate> gate;
        std::unique_ptr<lazyserve::core::StaticFileHandler> handler;
    };

} // namespace

TEST(StaticFileHandler, GetBuildsThenAnswersWithFile)
{
    Site site("get");

    const auto response = site.handler->handle(request("GET", "/app.js"));
    EXPECT_EQ(response.status, 200);
    ASSERT_TRUE(response.file.has_value());
    EXPECT_EQ(*response.file, site.root / "app.js");
    EXPECT_EQ(response.contentLength(), 15U);
    EXPECT_EQ(response.contentType, "application/javascript; charset=utf-8");
    EXPECT_EQ(site.builds, 1);

    site.handler->handle(request("GET", "/"));
    EXPECT_EQ(site.builds, 1);
}

TEST(StaticFileHandler, DirectoriesMapToIndexFile)
{
    Site site("index");

    const auto home = site.handler->handle(request("GET", "/"));
    ASSERT_TRUE(home.file.has_value());
    EXPECT_EQ(*home.file, site.root / "index.html");

    const auto docs = site.handler->handle(request("GET", "/docs/"));
    ASSERT_TRUE(docs.file.has_value());
    EXPECT_EQ(*docs.file, site.root / "docs" / "index.html");
}

TEST(StaticFileHandler, FailedBuildAnswersWithEscapedLog)
{
    Site site("failed", false);

    const auto response = site.handler->handle(request("GET", "/app.js"));
    EXPECT_EQ(response.status, 200);
    EXPECT_FALSE(response.file.has_value());
    EXPECT_EQ(response.contentType, "text/html; charset=utf-8");
    EXPECT_EQ(response.body, "<pre>Failed to build! Command output:\n\nsite.c:1: error: a &lt; b\n</pre>");

    site.handler->handle(request("GET", "/app.js"));
    EXPECT_EQ(site.builds, 2);
}

TEST(StaticFileHandler, HeadAndOtherMethodsDoNotBuild)
{
    Site site("methods", false);

    const auto head = site.handler->handle(request("HEAD", "/index.html"));
    EXPECT_EQ(head.status, 200);
    EXPECT_TRUE(head.file.has_value());

    const auto post = site.handler->handle(request("POST", "/index.html"));
    EXPECT_EQ(post.status, 405);

    EXPECT_EQ(site.builds, 0);
}

TEST(StaticFileHandler, RejectsTraversalAndReportsMissingFiles)
{
    Site site("paths");

    EXPECT_EQ(site.handler->handle(request("GET", "/../secret")).status, 403);
    EXPECT_EQ(site.handler->handle(request("GET", "/docs/%2e%2e/%2e%2e/secret")).status, 403);
    EXPECT_EQ(site.handler->handle(request("GET", "/missing.html")).status, 404);
}

#ifndef _WIN32
TEST(StaticFileHandler, SymlinkLeadingOutOfRootIsForbidden)
{
    Site site("symlink");
    const fs::path outside = makeTempRoot("symlink_outside");
    writeText(outside / "secret.txt", "secret");

    std::error_code ec;
    fs::create_symlink(outside / "secret.txt", site.root / "leak.txt", ec);
    ASSERT_FALSE(ec) << ec.message();

    EXPECT_EQ(site.handler->handle(request("GET", "/leak.txt")).status, 403);

    cleanupTemp(outside);
}
#endif
