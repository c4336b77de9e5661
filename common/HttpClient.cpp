#include "HttpClient.hpp"
#include "Log.hpp"
#include "SocketUtils.hpp"

#include <algorithm>
#include <cctype>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace net_scan::common
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        int RemainingMs(Clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string Trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        SSL_CTX *ClientContext()
        {
            static SSL_CTX *ctx = []() -> SSL_CTX *
            {
                SSL_CTX *c = SSL_CTX_new(TLS_client_method());
                if (!c)
                {
                    Log(LogLevel::Warn, "Http") << "unable to create SSL context";
                    return nullptr;
                }
                SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
                return c;
            }();
            return ctx;
        }

        // Owns an SSL session bound to a socket it does not own.
        class TlsSession
        {
        public:
            TlsSession(SSL_CTX *ctx, int fd) : m_ssl(ctx ? SSL_new(ctx) : nullptr), m_fd(fd)
            {
                if (m_ssl)
                    SSL_set_fd(m_ssl, fd);
            }
            ~TlsSession()
            {
                if (m_ssl)
                {
                    SSL_shutdown(m_ssl);
                    SSL_free(m_ssl);
                }
            }
            TlsSession(const TlsSession &) = delete;
            TlsSession &operator=(const TlsSession &) = delete;

            bool Handshake(const std::string &host, Clock::time_point deadline)
            {
                if (!m_ssl)
                    return false;
                SSL_set_tlsext_host_name(m_ssl, host.c_str());
                while (true)
                {
                    int rc = SSL_connect(m_ssl);
                    if (rc == 1)
                        return true;
                    if (!WaitFor(SSL_get_error(m_ssl, rc), deadline))
                    {
                        ERR_clear_error();
                        return false;
                    }
                }
            }

            bool WriteAll(const std::string &data, Clock::time_point deadline)
            {
                std::size_t off = 0;
                while (off < data.size())
                {
                    int n = SSL_write(m_ssl, data.data() + off, static_cast<int>(data.size() - off));
                    if (n > 0)
                    {
                        off += static_cast<std::size_t>(n);
                        continue;
                    }
                    if (!WaitFor(SSL_get_error(m_ssl, n), deadline))
                        return false;
                }
                return true;
            }

            // >0 bytes read, 0 closed, -1 error/timeout
            int Read(char *buf, int len, Clock::time_point deadline)
            {
                while (true)
                {
                    int n = SSL_read(m_ssl, buf, len);
                    if (n > 0)
                        return n;
                    int err = SSL_get_error(m_ssl, n);
                    if (err == SSL_ERROR_ZERO_RETURN)
                        return 0;
                    if (!WaitFor(err, deadline))
                        return -1;
                }
            }

        private:
            bool WaitFor(int err, Clock::time_point deadline)
            {
                if (err == SSL_ERROR_WANT_READ)
                    return WaitFd(m_fd, POLLIN, RemainingMs(deadline));
                if (err == SSL_ERROR_WANT_WRITE)
                    return WaitFd(m_fd, POLLOUT, RemainingMs(deadline));
                return false;
            }

            SSL *m_ssl;
            int m_fd;
        };

        bool HeadersComplete(const std::string &raw, std::size_t max_body)
        {
            auto end = raw.find("\r\n\r\n");
            if (end == std::string::npos)
                return false;
            return raw.size() - (end + 4) >= max_body;
        }

        std::string BuildRequest(const std::string &host, std::uint16_t port, const std::string &path)
        {
            std::ostringstream req;
            req << "GET " << (path.empty() ? "/" : path) << " HTTP/1.1\r\n"
                << "Host: " << host;
            if (port != 80 && port != 443)
                req << ':' << port;
            req << "\r\n"
                << "User-Agent: netscan/1.0\r\n"
                << "Accept: */*\r\n"
                << "Connection: close\r\n\r\n";
            return req.str();
        }
    }

    std::string HttpResponse::Header(const std::string &name, const std::string &fallback) const
    {
        auto it = headers.find(Lower(name));
        return it == headers.end() ? fallback : it->second;
    }

    std::optional<HttpUrl> ParseHttpUrl(const std::string &url)
    {
        HttpUrl out;
        std::string rest;
        if (url.rfind("http://", 0) == 0)
        {
            rest = url.substr(7);
        }
        else if (url.rfind("https://", 0) == 0)
        {
            rest = url.substr(8);
            out.tls = true;
            out.port = 443;
        }
        else
        {
            return std::nullopt;
        }

        auto slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        out.path = slash == std::string::npos ? "/" : rest.substr(slash);

        std::string port_str;
        if (!authority.empty() && authority[0] == '[')
        {
            auto close = authority.find(']');
            if (close == std::string::npos)
                return std::nullopt;
            out.host = authority.substr(1, close - 1);
            if (close + 1 < authority.size() && authority[close + 1] == ':')
                port_str = authority.substr(close + 2);
        }
        else
        {
            auto colon = authority.find(':');
            out.host = authority.substr(0, colon);
            if (colon != std::string::npos)
                port_str = authority.substr(colon + 1);
        }

        if (out.host.empty())
            return std::nullopt;

        if (!port_str.empty())
        {
            try
            {
                int port = std::stoi(port_str);
                if (port <= 0 || port > 65535)
                    return std::nullopt;
                out.port = static_cast<std::uint16_t>(port);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
        return out;
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        auto header_end = raw.find("\r\n\r\n");
        std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);

        std::stringstream ss(head);
        std::string status_line;
        if (!std::getline(ss, status_line))
            return std::nullopt;
        status_line = Trim(status_line);

        HttpResponse resp;
        if (status_line.rfind("HTTP/", 0) == 0)
        {
            auto sp = status_line.find(' ');
            if (sp == std::string::npos)
                return std::nullopt;
            try
            {
                resp.status_code = std::stoi(status_line.substr(sp + 1, 3));
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }
        else if (status_line.find("HTTP/") == std::string::npos)
        {
            return std::nullopt;
        }

        std::string line;
        while (std::getline(ss, line))
        {
            auto colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            std::string key = Lower(Trim(line.substr(0, colon)));
            if (key.empty())
                continue;
            resp.headers[key] = Trim(line.substr(colon + 1));
        }

        if (header_end != std::string::npos)
            resp.body = raw.substr(header_end + 4);
        return resp;
    }

    std::optional<HttpResponse> HttpGet(const std::string &host, std::uint16_t port, const std::string &path,
                                        bool tls, std::chrono::milliseconds timeout, std::size_t max_body)
    {
        const auto deadline = Clock::now() + timeout;

        auto fd = ConnectWithTimeout(host, port, timeout);
        if (!fd)
            return std::nullopt;

        const std::string host_header = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        const std::string request = BuildRequest(host_header, port, path);
        const std::size_t max_raw = max_body + 16 * 1024;
        std::string raw;
        char buf[4096];

        try
        {
            if (tls)
            {
                SetNonBlocking(fd->Get(), true);
                TlsSession session(ClientContext(), fd->Get());
                if (!session.Handshake(host, deadline) || !session.WriteAll(request, deadline))
                    return std::nullopt;

                while (raw.size() < max_raw && !HeadersComplete(raw, max_body))
                {
                    int n = session.Read(buf, sizeof(buf), deadline);
                    if (n <= 0)
                        break;
                    raw.append(buf, static_cast<std::size_t>(n));
                }
            }
            else
            {
                SetIoTimeout(fd->Get(), timeout);
                std::size_t off = 0;
                while (off < request.size())
                {
                    ssize_t n = send(fd->Get(), request.data() + off, request.size() - off, MSG_NOSIGNAL);
                    if (n <= 0)
                        return std::nullopt;
                    off += static_cast<std::size_t>(n);
                }

                while (raw.size() < max_raw && !HeadersComplete(raw, max_body))
                {
                    if (!WaitFd(fd->Get(), POLLIN, RemainingMs(deadline)))
                        break;
                    ssize_t n = recv(fd->Get(), buf, sizeof(buf), 0);
                    if (n <= 0)
                        break;
                    raw.append(buf, static_cast<std::size_t>(n));
                }
            }
        }
        catch (const std::exception &e)
        {
            Log(LogLevel::Debug, "Http") << "GET " << host << ':' << port << path << " failed: " << e.what();
            return std::nullopt;
        }

        auto resp = ParseHttpResponse(raw);
        if (!resp || resp->status_code == 0)
            return std::nullopt;
        if (resp->body.size() > max_body)
            resp->body.resize(max_body);
        return resp;
    }

    std::optional<HttpResponse> HttpGet(const HttpUrl &url, std::chrono::milliseconds timeout, std::size_t max_body)
    {
        return HttpGet(url.host, url.port, url.path, url.tls, timeout, max_body);
    }
}
