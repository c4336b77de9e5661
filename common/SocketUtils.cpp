#include "SocketUtils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace net_scan::common
{
    void ScopedFd::Reset(int fd)
    {
        if (m_fd >= 0)
            close(m_fd);
        m_fd = fd;
    }

    bool IsRoot()
    {
        return geteuid() == 0;
    }

    bool SetNonBlocking(int fd, bool enabled)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0)
            return false;
        flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
        return fcntl(fd, F_SETFL, flags) == 0;
    }

    bool WaitFd(int fd, short events, int timeout_ms)
    {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int r;
        do
        {
            r = poll(&pfd, 1, timeout_ms);
        } while (r < 0 && errno == EINTR);

        return r > 0 && (pfd.revents & events) != 0;
    }

    void SetIoTimeout(int fd, std::chrono::milliseconds timeout)
    {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    bool MakeSockAddr(const std::string &address, std::uint16_t port, sockaddr_storage &storage, socklen_t &length)
    {
        std::memset(&storage, 0, sizeof(storage));

        auto *v4 = reinterpret_cast<sockaddr_in *>(&storage);
        if (inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1)
        {
            v4->sin_family = AF_INET;
            v4->sin_port = htons(port);
            length = sizeof(sockaddr_in);
            return true;
        }

        std::string host = address;
        std::string scope;
        auto pct = address.find('%');
        if (pct != std::string::npos)
        {
            host = address.substr(0, pct);
            scope = address.substr(pct + 1);
        }

        auto *v6 = reinterpret_cast<sockaddr_in6 *>(&storage);
        if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1)
        {
            v6->sin6_family = AF_INET6;
            v6->sin6_port = htons(port);
            if (!scope.empty())
                v6->sin6_scope_id = if_nametoindex(scope.c_str());
            length = sizeof(sockaddr_in6);
            return true;
        }
        return false;
    }

    std::optional<ScopedFd> ConnectWithTimeout(const std::string &address, std::uint16_t port,
                                               std::chrono::milliseconds timeout)
    {
        sockaddr_storage storage{};
        socklen_t length = 0;
        if (!MakeSockAddr(address, port, storage, length))
            return std::nullopt;

        ScopedFd fd(socket(storage.ss_family, SOCK_STREAM, 0));
        if (!fd.Valid() || !SetNonBlocking(fd.Get(), true))
            return std::nullopt;

        int rc = connect(fd.Get(), reinterpret_cast<sockaddr *>(&storage), length);
        if (rc != 0)
        {
            if (errno != EINPROGRESS)
                return std::nullopt;
            if (!WaitFd(fd.Get(), POLLOUT, static_cast<int>(timeout.count())))
                return std::nullopt;

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd.Get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0)
                return std::nullopt;
        }

        SetNonBlocking(fd.Get(), false);
        return fd;
    }

    std::string SockAddrToString(const sockaddr_storage &storage)
    {
        char buf[INET6_ADDRSTRLEN] = {};
        if (storage.ss_family == AF_INET)
        {
            const auto *v4 = reinterpret_cast<const sockaddr_in *>(&storage);
            inet_ntop(AF_INET, &v4->sin_addr, buf, sizeof(buf));
        }
        else if (storage.ss_family == AF_INET6)
        {
            const auto *v6 = reinterpret_cast<const sockaddr_in6 *>(&storage);
            inet_ntop(AF_INET6, &v6->sin6_addr, buf, sizeof(buf));
        }
        return buf;
    }

    std::vector<Datagram> ReceiveUntil(int fd, std::chrono::steady_clock::time_point deadline, std::size_t max_size)
    {
        std::vector<Datagram> received;
        std::vector<std::uint8_t> buffer(max_size);

        while (true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 deadline - std::chrono::steady_clock::now())
                                 .count();
            if (remaining <= 0 || !WaitFd(fd, POLLIN, static_cast<int>(remaining)))
                break;

            sockaddr_storage source{};
            socklen_t length = sizeof(source);
            ssize_t n = recvfrom(fd, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&source), &length);
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                    continue;
                break;
            }

            Datagram datagram;
            datagram.source = SockAddrToString(source);
            datagram.payload.assign(buffer.begin(), buffer.begin() + n);
            received.push_back(std::move(datagram));
        }
        return received;
    }
}
