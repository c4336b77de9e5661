#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace net_scan::common
{
    struct HttpResponse
    {
        int status_code = 0;
        std::map<std::string, std::string> headers; // keys lowercased
        std::string body;

        std::string Header(const std::string &name, const std::string &fallback = "") const;
    };

    struct HttpUrl
    {
        std::string host;
        std::uint16_t port = 80;
        std::string path = "/";
        bool tls = false;
    };

    // http://host[:port]/path and https://...; IPv6 hosts in brackets.
    std::optional<HttpUrl> ParseHttpUrl(const std::string &url);

    // Parses a status line plus headers ("HTTP/1.1 200 OK" or SSDP "HTTP/1.1 200 OK" / "NOTIFY * HTTP/1.1").
    // Body is whatever follows the blank line.
    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // Minimal GET over a fresh connection ("Connection: close"). TLS uses OpenSSL without
    // certificate verification; the goal is banner capture, not trust.
    // At most max_body bytes of body are kept; the whole exchange is bounded by timeout.
    std::optional<HttpResponse> HttpGet(const std::string &host, std::uint16_t port, const std::string &path,
                                        bool tls, std::chrono::milliseconds timeout, std::size_t max_body = 64 * 1024);

    std::optional<HttpResponse> HttpGet(const HttpUrl &url, std::chrono::milliseconds timeout,
                                        std::size_t max_body = 64 * 1024);
}
