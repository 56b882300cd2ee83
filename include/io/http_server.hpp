#pragma once

#include <functional>
#include <string>

#include "core/context.hpp"
#include "io/http_message.hpp"

namespace lazyserve::io {

struct HttpServerOptions {
    std::string host = "0.0.0.0";
    int port = 3000;
};

// Called from worker threads, possibly concurrently.
using HttpHandler = std::function<HttpResponse(const HttpRequest &)>;

// Clears any earlier stop request. Call it before anything that may call
// stopHttpServer(), such as a signal handler, is installed.
void armHttpServer();

// Safe to call from a signal handler. A request made before serveHttp()
// starts still stops it.
void stopHttpServer();

// Accepts connections on host:port and hands each request to `handler` on a
// worker pool. Blocks until stopHttpServer(); false when the listener cannot
// be set up.
bool serveHttp(const lazyserve::Context &ctx, const HttpServerOptions &options, const HttpHandler &handler);

bool isHttpPortAvailable(const lazyserve::Context &ctx, const std::string &host, int port);

} // namespace lazyserve::io
