#pragma once

#include <iostream>
#include <mutex>

namespace lazyserve {

class Context {
public:
    explicit Context(bool verbose = true) : verbose_(verbose) {}

    template <typename... Args>
    void log(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        (std::cout << ... << args) << '\n';
    }

    // Only printed with --verbose.
    template <typename... Args>
    void debug(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cout << "[debug] ";
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    bool verbose() const { return verbose_; }

private:
    // Request workers log concurrently; keep each line whole.
    static std::mutex &outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    bool verbose_;
};

} // namespace lazyserve
