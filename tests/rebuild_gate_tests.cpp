#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/rebuild_gate.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path root = fs::temp_directory_path() / ("lazyserve_gate_test_" + name + "_" + std::to_string(now));
        fs::create_directories(root);
        return fs::canonical(root);
    }

    void writeFile(const fs::path &file, fs::file_time_type stamp)
    {
        fs::create_directories(file.parent_path());
        {
            std::ofstream out(file);
            out << "<html></html>";
        }
        fs::last_write_time(file, stamp);
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    const fs::file_time_type kT0 =
        std::chrono::time_point_cast<std::chrono::seconds>(fs::file_time_type::clock::now() - 1h);

    // Counts invocations and answers with a scripted outcome.
    struct FakeBuild
    {
        std::atomic<int> calls{0};
        std::atomic<bool> succeed{true};
        std::chrono::milliseconds delay{0};

        lazyserve::core::RebuildGate::BuildRunner runner()
        {
            return [this](const std::string &)
            {
                ++calls;
                if (delay.count() > 0)
                {
                    std::this_thread::sleep_for(delay);
                }
                lazyserve::io::BuildResult result;
                result.succeeded = succeed;
                result.exitStatus = succeed ? 0 : 2;
                result.output = succeed ? "ok\n" : "error: broken\n";
                return result;
            };
        }
    };

    lazyserve::core::RebuildGateOptions gateOptions(const fs::path &root, const std::string &command = "make")
    {
        lazyserve::core::RebuildGateOptions options;
        options.watchRoot = root;
        options.command = command;
        return options;
    }

} // namespace

TEST(RebuildGate, FirstCheckAlwaysBuilds)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("first");
    FakeBuild build;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    EXPECT_FALSE(gate.lastKnownFingerprint().has_value());
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 1);

    cleanupTemp(root);
}

TEST(RebuildGate, UnchangedTreeBuildsOnlyOnce)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("idempotent");
    writeFile(root / "index.html", kT0);
    FakeBuild build;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 1);
    EXPECT_EQ(gate.buildCount(), 1U);

    cleanupTemp(root);
}

TEST(RebuildGate, FailedBuildIsRetriedWithoutChanges)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("retry");
    writeFile(root / "index.html", kT0);
    FakeBuild build;
    build.succeed = false;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    auto first = gate.ensureFresh();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->message, "Failed to build! Command output:\n\nerror: broken\n");
    EXPECT_FALSE(gate.lastKnownFingerprint().has_value());

    auto second = gate.ensureFresh();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(build.calls.load(), 2);

    build.succeed = true;
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 3);
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 3);

    cleanupTemp(root);
}

TEST(RebuildGate, FailureKeepsPreviousBaseline)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("baseline_kept");
    writeFile(root / "index.html", kT0);
    FakeBuild build;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    ASSERT_FALSE(gate.ensureFresh().has_value());
    ASSERT_EQ(gate.lastKnownFingerprint(), kT0);

    fs::last_write_time(root / "index.html", kT0 + 1min);
    build.succeed = false;
    EXPECT_TRUE(gate.ensureFresh().has_value());
    EXPECT_EQ(gate.lastKnownFingerprint(), kT0);

    cleanupTemp(root);
}

TEST(RebuildGate, ChangeToIgnoredPathDoesNotRebuild)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("ignored");
    writeFile(root / "src" / "page.md", kT0);
    writeFile(root / "_build" / "page.html", kT0);
    FakeBuild build;

    auto options = gateOptions(root);
    options.ignoredPaths.insert(root / "_build");
    lazyserve::core::RebuildGate gate(ctx, options, build.runner());

    ASSERT_FALSE(gate.ensureFresh().has_value());
    const auto baseline = gate.lastKnownFingerprint();

    fs::last_write_time(root / "_build" / "page.html", kT0 + 1h);
    writeFile(root / "_build" / "new.html", kT0 + 2h);

    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 1);
    EXPECT_EQ(gate.lastKnownFingerprint(), baseline);

    cleanupTemp(root);
}

TEST(RebuildGate, SuccessStoresPreBuildFingerprint)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("baseline");
    writeFile(root / "index.html", kT0);
    FakeBuild build;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    ASSERT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(gate.lastKnownFingerprint(), kT0);

    fs::last_write_time(root / "index.html", kT0 + 30s);
    ASSERT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 2);
    EXPECT_EQ(gate.lastKnownFingerprint(), kT0 + 30s);

    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(build.calls.load(), 2);

    cleanupTemp(root);
}

TEST(RebuildGate, ConcurrentChecksRunOneBuild)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("concurrent");
    writeFile(root / "index.html", kT0);
    FakeBuild build;
    build.delay = 200ms;
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root), build.runner());

    std::atomic<int> failures{0};
    auto check = [&]()
    {
        if (gate.ensureFresh().has_value())
        {
            ++failures;
        }
    };

    std::thread a(check);
    std::thread b(check);
    a.join();
    b.join();

    EXPECT_EQ(build.calls.load(), 1);
    EXPECT_EQ(failures.load(), 0);

    cleanupTemp(root);
}

TEST(RebuildGate, EchoCommandBuildsOnceThenServesFromBaseline)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("echo");
    writeFile(root / "index.html", kT0);
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root, "echo done"));

    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(gate.lastKnownFingerprint(), kT0);
    EXPECT_FALSE(gate.ensureFresh().has_value());
    EXPECT_EQ(gate.buildCount(), 1U);

    cleanupTemp(root);
}

TEST(RebuildGate, ExitOneReportsFailureAndRetries)
{
    const lazyserve::Context ctx(false);
    const fs::path root = makeTempRoot("exit1");
    writeFile(root / "index.html", kT0);
    lazyserve::core::RebuildGate gate(ctx, gateOptions(root, "echo oops; exit 1"));

    auto failure = gate.ensureFresh();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->message.rfind("Failed to build! Command output:", 0), 0U);
    EXPECT_NE(failure->message.find("oops"), std::string::npos);
    EXPECT_FALSE(gate.lastKnownFingerprint().has_value());

    EXPECT_TRUE(gate.ensureFresh().has_value());
    EXPECT_EQ(gate.buildCount(), 2U);

    cleanupTemp(root);
}
