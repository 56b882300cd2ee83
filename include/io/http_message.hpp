#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lazyserve::io {

struct HttpRequest {
    std::string method;
    std::string target;

    bool isHead() const { return method == "HEAD"; }
};

// A handler's answer. When `file` is set the server streams that file as the
// body and `body` is unused.
struct HttpResponse {
    int status = 200;
    std::string contentType = "text/plain; charset=utf-8";
    std::string body;
    std::optional<std::filesystem::path> file;
    std::uintmax_t fileSize = 0;

    static HttpResponse text(int status, std::string body);
    static HttpResponse html(std::string body);
    static HttpResponse fromFile(const std::filesystem::path &file, std::uintmax_t size);

    std::uintmax_t contentLength() const;

    // Status line and headers, terminated by the empty line.
    std::string head() const;
};

// Reads the request line out of a complete request head.
std::optional<HttpRequest> parseHttpRequestHead(const std::string &head);

const char *httpStatusText(int status);

std::string detectHttpMimeType(const std::filesystem::path &path);

// Turns a request target into a path relative to the serve root. Fails on
// `..` segments and control characters; an empty path maps to `indexFile`.
bool sanitizeHttpRelativePath(
    const std::string &rawTarget,
    const std::string &indexFile,
    std::filesystem::path &relativeOut
);

// True when the canonical form of `filePath` lies under `serveRoot`.
bool isHttpPathSafe(const std::filesystem::path &filePath, const std::filesystem::path &serveRoot);

std::string htmlEscape(const std::string &text);

} // namespace lazyserve::io
