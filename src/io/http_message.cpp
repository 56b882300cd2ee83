#include "io/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace fs = std::filesystem;

namespace lazyserve::io
{
    namespace
    {

        int hexDigit(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        // Percent escapes only. '+' stays literal because it is a path, not a form.
        std::string percentDecode(const std::string &raw)
        {
            std::string out;
            out.reserve(raw.size());
            std::size_t i = 0;
            while (i < raw.size())
            {
                if (raw[i] == '%' && i + 2 < raw.size())
                {
                    const int hi = hexDigit(raw[i + 1]);
                    const int lo = hexDigit(raw[i + 2]);
                    if (hi >= 0 && lo >= 0)
                    {
                        out.push_back(static_cast<char>(hi * 16 + lo));
                        i += 3;
                        continue;
                    }
                }
                out.push_back(raw[i]);
                ++i;
            }
            return out;
        }

        bool isPlainSegment(const std::string &segment)
        {
            return std::none_of(segment.begin(), segment.end(), [](char ch)
                                { return static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f; });
        }

    } // namespace

    HttpResponse HttpResponse::text(int status, std::string body)
    {
        HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        return response;
    }

    HttpResponse HttpResponse::html(std::string body)
    {
        HttpResponse response;
        response.contentType = "text/html; charset=utf-8";
        response.body = std::move(body);
        return response;
    }

    HttpResponse HttpResponse::fromFile(const fs::path &file, std::uintmax_t size)
    {
        HttpResponse response;
        response.contentType = detectHttpMimeType(file);
        response.file = file;
        response.fileSize = size;
        return response;
    }

    std::uintmax_t HttpResponse::contentLength() const
    {
        return file ? fileSize : static_cast<std::uintmax_t>(body.size());
    }

    std::string HttpResponse::head() const
    {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + httpStatusText(status) + "\r\n";
        out += "Content-Type: " + contentType + "\r\n";
        out += "Content-Length: " + std::to_string(contentLength()) + "\r\n";
        // Every response may be stale after the next build.
        out += "Cache-Control: no-cache\r\n";
        out += "Connection: close\r\n";
        if (status == 405)
        {
            out += "Allow: GET, HEAD\r\n";
        }
        out += "\r\n";
        return out;
    }

    std::optional<HttpRequest> parseHttpRequestHead(const std::string &head)
    {
        const std::size_t lineEnd = head.find("\r\n");
        if (lineEnd == std::string::npos)
        {
            return std::nullopt;
        }
        const std::string line = head.substr(0, lineEnd);

        // METHOD SP TARGET SP VERSION
        const std::size_t first = line.find(' ');
        const std::size_t second = first == std::string::npos ? std::string::npos : line.find(' ', first + 1);
        if (second == std::string::npos || first == 0 || second == first + 1)
        {
            return std::nullopt;
        }

        HttpRequest request;
        request.method = line.substr(0, first);
        request.target = line.substr(first + 1, second - first - 1);
        return request;
    }

    const char *httpStatusText(int status)
    {
        switch (status)
        {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 500:
            return "Internal Server Error";
        default:
            return "Unknown";
        }
    }

    std::string detectHttpMimeType(const fs::path &path)
    {
        static const std::unordered_map<std::string, std::string> kTypes = {
            // documents
            {".html", "text/html; charset=utf-8"},
            {".htm", "text/html; charset=utf-8"},
            {".css", "text/css; charset=utf-8"},
            {".txt", "text/plain; charset=utf-8"},
            {".md", "text/markdown; charset=utf-8"},
            {".xml", "application/xml; charset=utf-8"},
            {".pdf", "application/pdf"},
            // scripts and data
            {".js", "application/javascript; charset=utf-8"},
            {".mjs", "application/javascript; charset=utf-8"},
            {".json", "application/json; charset=utf-8"},
            {".map", "application/json; charset=utf-8"},
            {".wasm", "application/wasm"},
            // media
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".svg", "image/svg+xml"},
            {".ico", "image/x-icon"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".woff", "font/woff"},
            {".woff2", "font/woff2"},
            {".ttf", "font/ttf"},
        };

        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });

        const auto it = kTypes.find(ext);
        return it == kTypes.end() ? std::string("application/octet-stream") : it->second;
    }

    bool sanitizeHttpRelativePath(
        const std::string &rawTarget,
        const std::string &indexFile,
        fs::path &relativeOut)
    {
        std::string decoded = percentDecode(rawTarget.substr(0, rawTarget.find_first_of("?#")));
        std::replace(decoded.begin(), decoded.end(), '\\', '/');

        fs::path relative;
        std::size_t begin = 0;
        while (begin <= decoded.size())
        {
            std::size_t end = decoded.find('/', begin);
            if (end == std::string::npos)
            {
                end = decoded.size();
            }
            const std::string segment = decoded.substr(begin, end - begin);
            begin = end + 1;

            if (segment.empty() || segment == ".")
            {
                continue;
            }
            if (segment == ".." || !isPlainSegment(segment))
            {
                return false;
            }
            relative /= segment;
        }

        relativeOut = relative.empty() ? fs::path(indexFile) : relative;
        return true;
    }

    bool isHttpPathSafe(const fs::path &filePath, const fs::path &serveRoot)
    {
        std::error_code ec;
        const fs::path file = fs::canonical(filePath, ec);
        if (ec)
        {
            return false;
        }
        const fs::path root = fs::canonical(serveRoot, ec);
        if (ec)
        {
            return false;
        }

        const auto diverged = std::mismatch(root.begin(), root.end(), file.begin(), file.end());
        return diverged.first == root.end();
    }

    std::string htmlEscape(const std::string &text)
    {
        std::string out;
        out.reserve(text.size() + text.size() / 8);
        for (const char ch : text)
        {
            if (ch == '&')
            {
                out += "&amp;";
            }
            else if (ch == '<')
            {
                out += "&lt;";
            }
            else if (ch == '>')
            {
                out += "&gt;";
            }
            else
            {
                out.push_back(ch);
            }
        }
        return out;
    }

} // namespace lazyserve::io
