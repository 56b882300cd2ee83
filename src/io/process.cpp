#include "io/process.hpp"

#include <array>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#include <cstdio>
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace lazyserve::io {
namespace {

constexpr std::size_t kOutputChunkSize = 4 * 1024;

std::string buildDisplayCommand(const std::string &command, const std::vector<std::string> &args) {
    std::ostringstream cmd;
    cmd << shellQuote(command);
    for (const auto &arg : args) {
        cmd << ' ' << shellQuote(arg);
    }
    return cmd.str();
}

bool validateWorkingDirectory(const std::filesystem::path &cwd, const lazyserve::Context &ctx) {
    if (cwd.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(cwd, ec) || !std::filesystem::is_directory(cwd, ec)) {
        ctx.error("Working directory does not exist: ", cwd.string());
        return false;
    }
    return true;
}

#ifdef _WIN32

bool utf8ToWide(const std::string &input, std::wstring &out) {
    out.clear();
    if (input.empty()) {
        return true;
    }

    const int size = MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
    if (size <= 0) {
        return false;
    }

    out.resize(static_cast<std::size_t>(size));
    if (MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, out.data(), size) <= 0) {
        out.clear();
        return false;
    }
    return true;
}

ProcessResult runCommandWindows(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const lazyserve::Context &ctx
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    std::wstring wideCmdLine;
    if (!utf8ToWide(result.commandLine, wideCmdLine)) {
        ctx.error("Failed to convert command line to wide string");
        return result;
    }

    std::wstring wideCwd;
    wchar_t *cwdPtr = nullptr;
    if (!cwd.empty()) {
        if (!utf8ToWide(cwd.string(), wideCwd)) {
            ctx.error("Failed to convert working directory to wide string");
            return result;
        }
        cwdPtr = wideCwd.data();
    }

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};

    BOOL ok = CreateProcessW(nullptr, wideCmdLine.data(), nullptr, nullptr, FALSE, 0, nullptr, cwdPtr, &si, &pi);
    if (!ok) {
        ctx.error("Failed to create process: Error code ", static_cast<unsigned long>(GetLastError()));
        return result;
    }

    result.processId = static_cast<long long>(pi.dwProcessId);
    WaitForSingleObject(pi.hProcess, INFINITE);

    DWORD exitCode = 0;
    if (GetExitCodeProcess(pi.hProcess, &exitCode)) {
        result.code = static_cast<int>(exitCode);
    } else {
        ctx.error("Failed to get process exit code");
    }

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return result;
}

BuildResult runShellWindows(const std::string &command, const lazyserve::Context &ctx) {
    BuildResult result;
    if (command.empty()) {
        result.succeeded = true;
        result.exitStatus = 0;
        return result;
    }

    const std::string shellLine = "(" + command + ") 2>&1";
    FILE *pipe = _popen(shellLine.c_str(), "rb");
    if (pipe == nullptr) {
        result.output = "Failed to launch build command: " + command + "\n";
        ctx.error("Failed to launch shell for: ", command);
        return result;
    }

    std::array<char, kOutputChunkSize> chunk{};
    std::size_t got = 0;
    while ((got = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
        result.output.append(chunk.data(), got);
    }

    result.exitStatus = _pclose(pipe);
    result.succeeded = result.exitStatus == 0;
    return result;
}

#else

std::vector<char *> makeArgv(std::vector<std::string> &storage) {
    std::vector<char *> argv;
    argv.reserve(storage.size() + 1);
    for (auto &item : storage) {
        argv.push_back(const_cast<char *>(item.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

bool waitForChild(pid_t pid, int &status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

ProcessResult runCommandPosix(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const lazyserve::Context &ctx
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);

    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv = makeArgv(storage);

    const pid_t pid = fork();
    if (pid < 0) {
        ctx.error("Failed to fork process: ", std::strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    result.processId = static_cast<long long>(pid);
    int status = 0;
    if (!waitForChild(pid, status)) {
        ctx.error("Failed to wait for process: ", std::strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.code = 128 + WTERMSIG(status);
        ctx.warn("Process terminated by signal: ", WTERMSIG(status));
    } else {
        ctx.error("Process ended abnormally");
    }
    return result;
}

BuildResult runShellPosix(const std::string &command, const lazyserve::Context &ctx) {
    BuildResult result;

    int fds[2] = {-1, -1};
    if (pipe(fds) != 0) {
        result.output = std::string("Failed to create output pipe: ") + std::strerror(errno) + "\n";
        ctx.error("Failed to create output pipe: ", std::strerror(errno));
        return result;
    }
    // Keep the read end out of children forked concurrently by other workers.
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    // Nothing but async-signal-safe calls between fork and exec.
    const char *shellCommand = command.c_str();
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(fds[0]);
        close(fds[1]);
        result.output = std::string("Failed to fork build process: ") + std::strerror(err) + "\n";
        ctx.error("Failed to fork build process: ", std::strerror(err));
        return result;
    }

    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        execl("/bin/sh", "sh", "-c", shellCommand, static_cast<char *>(nullptr));
        static const char kExecFailed[] = "lazyserve: failed to execute /bin/sh\n";
        ssize_t ignored = write(STDOUT_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)ignored;
        _exit(127);
    }

    close(fds[1]);

    std::array<char, kOutputChunkSize> chunk{};
    for (;;) {
        const ssize_t got = read(fds[0], chunk.data(), chunk.size());
        if (got > 0) {
            result.output.append(chunk.data(), static_cast<std::size_t>(got));
            continue;
        }
        if (got < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    close(fds[0]);

    int status = 0;
    if (!waitForChild(pid, status)) {
        result.output += std::string("Failed to wait for build process: ") + std::strerror(errno) + "\n";
        ctx.error("Failed to wait for build process: ", std::strerror(errno));
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
        ctx.warn("Build process terminated by signal: ", WTERMSIG(status));
    }
    result.succeeded = WIFEXITED(status) && result.exitStatus == 0;
    return result;
}

#endif

} // namespace

std::string shellQuote(const std::string &value) {
#ifdef _WIN32
    if (value.empty()) {
        return "\"\"";
    }

    bool needQuotes = false;
    for (char ch : value) {
        if (ch == ' ' || ch == '\t' || ch == '"') {
            needQuotes = true;
            break;
        }
    }
    if (!needQuotes) {
        return value;
    }

    std::string out;
    out.push_back('"');
    std::size_t backslashes = 0;
    for (char ch : value) {
        if (ch == '\\') {
            ++backslashes;
            continue;
        }
        if (ch == '"') {
            out.append(backslashes * 2 + 1, '\\');
            out.push_back('"');
            backslashes = 0;
            continue;
        }
        out.append(backslashes, '\\');
        backslashes = 0;
        out.push_back(ch);
    }
    out.append(backslashes * 2, '\\');
    out.push_back('"');
    return out;
#else
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
#endif
}

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const lazyserve::Context &ctx
) {
    ProcessResult result;
    result.commandLine = buildDisplayCommand(command, args);
    ctx.debug("run: ", result.commandLine);

    if (!validateWorkingDirectory(cwd, ctx)) {
        return result;
    }

#ifdef _WIN32
    return runCommandWindows(command, args, cwd, ctx);
#else
    return runCommandPosix(command, args, cwd, ctx);
#endif
}

BuildResult runShellCommand(const std::string &command, const lazyserve::Context &ctx) {
#ifdef _WIN32
    return runShellWindows(command, ctx);
#else
    return runShellPosix(command, ctx);
#endif
}

} // namespace lazyserve::io
