#include "io/http_server.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <climits>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#define NOMINMAX
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace lazyserve::io
{
    namespace
    {

        constexpr std::size_t kMaxRequestHead = 64 * 1024;
        constexpr std::size_t kReadChunk = 4 * 1024;
        constexpr std::size_t kFileChunk = 16 * 1024;
        constexpr int kBacklog = 128;
        constexpr int kReadTimeoutSeconds = 30;

#ifdef _WIN32
        using SocketHandle = SOCKET;
        constexpr SocketHandle kNoSocket = INVALID_SOCKET;
        constexpr int kSendFlags = 0;
#else
        using SocketHandle = int;
        constexpr SocketHandle kNoSocket = -1;
#ifdef MSG_NOSIGNAL
        // A client hanging up mid-response must not raise SIGPIPE.
        constexpr int kSendFlags = MSG_NOSIGNAL;
#else
        constexpr int kSendFlags = 0;
#endif
#endif

        std::atomic<bool> g_stopRequested{false};

        void closeSocket(SocketHandle handle)
        {
            if (handle == kNoSocket)
            {
                return;
            }
#ifdef _WIN32
            closesocket(handle);
#else
            close(handle);
#endif
        }

        std::string lastSocketError()
        {
#ifdef _WIN32
            return "WSA error " + std::to_string(WSAGetLastError());
#else
            return std::strerror(errno);
#endif
        }

        bool interruptedCall()
        {
#ifdef _WIN32
            return WSAGetLastError() == WSAEINTR;
#else
            return errno == EINTR;
#endif
        }

        class ScopedSocket
        {
        public:
            explicit ScopedSocket(SocketHandle handle) : handle_(handle) {}
            ~ScopedSocket() { closeSocket(handle_); }

            ScopedSocket(const ScopedSocket &) = delete;
            ScopedSocket &operator=(const ScopedSocket &) = delete;

            SocketHandle get() const { return handle_; }
            bool valid() const { return handle_ != kNoSocket; }

        private:
            SocketHandle handle_;
        };

        // WSAStartup/WSACleanup pairing; nothing to do on POSIX.
        class SocketRuntime
        {
        public:
            explicit SocketRuntime(const lazyserve::Context &ctx)
            {
#ifdef _WIN32
                WSADATA data{};
                ok_ = WSAStartup(MAKEWORD(2, 2), &data) == 0;
                if (!ok_)
                {
                    ctx.error("WSAStartup failed");
                }
#else
                (void)ctx;
#endif
            }

            ~SocketRuntime()
            {
#ifdef _WIN32
                if (ok_)
                {
                    WSACleanup();
                }
#endif
            }

            bool ok() const { return ok_; }

        private:
            bool ok_ = true;
        };

        // Creates a TCP socket bound to host:port with SO_REUSEADDR set.
        // Returns kNoSocket and fills `error` on failure.
        SocketHandle bindTcp(const std::string &hostInput, int port, std::string &error)
        {
            const std::string host = hostInput.empty() ? std::string("0.0.0.0") : hostInput;

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<unsigned short>(port));
            if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1)
            {
                error = "invalid IPv4 host '" + host + "'";
                return kNoSocket;
            }

            SocketHandle sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
            if (sock == kNoSocket)
            {
                error = "socket: " + lastSocketError();
                return kNoSocket;
            }

            int reuse = 1;
            setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char *>(&reuse), sizeof(reuse));

            if (bind(sock, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0)
            {
                error = "bind " + host + ":" + std::to_string(port) + ": " + lastSocketError();
                closeSocket(sock);
                return kNoSocket;
            }
            return sock;
        }

        void setReadTimeout(SocketHandle sock, int seconds)
        {
#ifdef _WIN32
            const DWORD timeout = static_cast<DWORD>(seconds) * 1000;
#else
            timeval timeout{};
            timeout.tv_sec = seconds;
#endif
            setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char *>(&timeout), sizeof(timeout));
        }

        bool writeAll(SocketHandle sock, const char *data, std::size_t size)
        {
            while (size > 0)
            {
                const int chunk = static_cast<int>(std::min<std::size_t>(size, INT_MAX));
                const auto sent = send(sock, data, chunk, kSendFlags);
                if (sent < 0)
                {
                    if (interruptedCall())
                    {
                        continue;
                    }
                    return false;
                }
                if (sent == 0)
                {
                    return false;
                }
                data += sent;
                size -= static_cast<std::size_t>(sent);
            }
            return true;
        }

        bool writeAll(SocketHandle sock, const std::string &text)
        {
            return writeAll(sock, text.data(), text.size());
        }

        enum class ReadOutcome
        {
            Complete,
            TooLarge,
            Closed
        };

        // Reads until the blank line that ends the request head.
        ReadOutcome readRequestHead(SocketHandle sock, std::string &head)
        {
            std::array<char, kReadChunk> buffer{};
            while (head.find("\r\n\r\n") == std::string::npos)
            {
                if (head.size() >= kMaxRequestHead)
                {
                    return ReadOutcome::TooLarge;
                }
                const std::size_t room = std::min(buffer.size(), kMaxRequestHead - head.size());
                const auto got = recv(sock, buffer.data(), static_cast<int>(room), 0);
                if (got < 0 && interruptedCall())
                {
                    continue;
                }
                if (got <= 0)
                {
                    return ReadOutcome::Closed;
                }
                head.append(buffer.data(), static_cast<std::size_t>(got));
            }
            return ReadOutcome::Complete;
        }

        bool writeResponse(SocketHandle sock, const HttpResponse &response, bool headOnly)
        {
            if (!response.file)
            {
                return writeAll(sock, response.head()) && (headOnly || writeAll(sock, response.body));
            }

            std::ifstream in(*response.file, std::ios::binary);
            if (!in)
            {
                // Removed between the handler's check and now; a rebuild may be rewriting it.
                return writeResponse(sock, HttpResponse::text(404, "Not found\n"), headOnly);
            }
            if (!writeAll(sock, response.head()))
            {
                return false;
            }
            if (headOnly)
            {
                return true;
            }

            std::array<char, kFileChunk> chunk{};
            while (in)
            {
                in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                const std::streamsize got = in.gcount();
                if (got > 0 && !writeAll(sock, chunk.data(), static_cast<std::size_t>(got)))
                {
                    return false;
                }
            }
            return true;
        }

        // One request per connection; the caller closes the socket.
        void serveConnection(SocketHandle sock, const HttpHandler &handler)
        {
            setReadTimeout(sock, kReadTimeoutSeconds);

            std::string head;
            switch (readRequestHead(sock, head))
            {
            case ReadOutcome::Closed:
                return;
            case ReadOutcome::TooLarge:
                (void)writeResponse(sock, HttpResponse::text(400, "Header too large\n"), false);
                return;
            case ReadOutcome::Complete:
                break;
            }

            const std::optional<HttpRequest> request = parseHttpRequestHead(head);
            if (!request)
            {
                (void)writeResponse(sock, HttpResponse::text(400, "Bad request\n"), false);
                return;
            }

            // A failed write only means the client went away.
            (void)writeResponse(sock, handler(*request), request->isHead());
        }

        std::size_t workerCountFor(unsigned int cpus)
        {
            if (cpus == 0)
            {
                return 4;
            }
            return std::clamp<std::size_t>(cpus, 2, 8);
        }

        // Accepted connections wait here until a worker picks them up.
        class ConnectionPool
        {
        public:
            ConnectionPool(std::size_t workers, const HttpHandler &handler)
                : handler_(handler)
            {
                threads_.reserve(workers);
                for (std::size_t i = 0; i < workers; ++i)
                {
                    threads_.emplace_back([this]()
                                          { run(); });
                }
            }

            ~ConnectionPool()
            {
                drain();
            }

            ConnectionPool(const ConnectionPool &) = delete;
            ConnectionPool &operator=(const ConnectionPool &) = delete;

            void submit(SocketHandle sock)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (!closing_)
                    {
                        pending_.push_back(sock);
                        ready_.notify_one();
                        return;
                    }
                }
                closeSocket(sock);
            }

            // Drops connections nobody has started on and waits for the rest.
            void drain()
            {
                std::deque<SocketHandle> dropped;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (closing_)
                    {
                        return;
                    }
                    closing_ = true;
                    dropped.swap(pending_);
                }
                ready_.notify_all();

                for (SocketHandle sock : dropped)
                {
                    closeSocket(sock);
                }
                for (auto &thread : threads_)
                {
                    thread.join();
                }
                threads_.clear();
            }

        private:
            void run()
            {
                for (;;)
                {
                    SocketHandle sock = kNoSocket;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        ready_.wait(lock, [this]()
                                    { return closing_ || !pending_.empty(); });
                        if (pending_.empty())
                        {
                            return;
                        }
                        sock = pending_.front();
                        pending_.pop_front();
                    }

                    serveConnection(sock, handler_);
                    closeSocket(sock);
                }
            }

            const HttpHandler &handler_;
            std::mutex mutex_;
            std::condition_variable ready_;
            std::deque<SocketHandle> pending_;
            std::vector<std::thread> threads_;
            bool closing_ = false;
        };

        // Waits up to one second for a pending connection so the caller can
        // re-check the stop flag.
        bool waitReadable(SocketHandle listener)
        {
            fd_set readable;
            FD_ZERO(&readable);
            FD_SET(listener, &readable);
            timeval tick{};
            tick.tv_sec = 1;
#ifdef _WIN32
            return select(0, &readable, nullptr, nullptr, &tick) > 0;
#else
            return select(listener + 1, &readable, nullptr, nullptr, &tick) > 0;
#endif
        }

    } // namespace

    void armHttpServer()
    {
        g_stopRequested = false;
    }

    void stopHttpServer()
    {
        g_stopRequested = true;
    }

    bool serveHttp(const lazyserve::Context &ctx, const HttpServerOptions &options, const HttpHandler &handler)
    {
        if (options.port <= 0 || options.port > 65535)
        {
            ctx.error("Invalid HTTP server port: ", options.port);
            return false;
        }

        SocketRuntime runtime(ctx);
        if (!runtime.ok())
        {
            return false;
        }

        std::string error;
        ScopedSocket listener(bindTcp(options.host, options.port, error));
        if (!listener.valid())
        {
            ctx.error("Cannot start HTTP server: ", error);
            return false;
        }
        if (listen(listener.get(), kBacklog) != 0)
        {
            ctx.error("Cannot listen on port ", options.port, ": ", lastSocketError());
            return false;
        }

        const std::size_t workers = workerCountFor(std::thread::hardware_concurrency());
        ConnectionPool pool(workers, handler);

        ctx.log("Serving on http://", options.host, ":", options.port, "/ (Ctrl+C to stop)");
        ctx.debug("Worker threads: ", workers);

        while (!g_stopRequested)
        {
            if (!waitReadable(listener.get()))
            {
                continue;
            }

            SocketHandle client = accept(listener.get(), nullptr, nullptr);
            if (client == kNoSocket)
            {
                if (!interruptedCall() && !g_stopRequested)
                {
                    ctx.warn("Accept failed: ", lastSocketError());
                }
                continue;
            }
            pool.submit(client);
        }

        ctx.log("Stopping HTTP server...");
        pool.drain();
        ctx.log("HTTP server stopped.");
        return true;
    }

    bool isHttpPortAvailable(const lazyserve::Context &ctx, const std::string &host, int port)
    {
        if (port <= 0 || port > 65535)
        {
            return false;
        }
        SocketRuntime runtime(ctx);
        if (!runtime.ok())
        {
            return false;
        }

        std::string error;
        ScopedSocket probe(bindTcp(host, port, error));
        if (!probe.valid())
        {
            ctx.debug("Port check failed: ", error);
        }
        return probe.valid();
    }

} // namespace lazyserve::io
