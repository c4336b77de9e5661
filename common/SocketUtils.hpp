#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sys/socket.h>

namespace net_scan::common
{
    // Owns a file descriptor; closes it on destruction.
    class ScopedFd
    {
    public:
        ScopedFd() = default;
        explicit ScopedFd(int fd) : m_fd(fd) {}
        ~ScopedFd() { Reset(); }

        ScopedFd(const ScopedFd &) = delete;
        ScopedFd &operator=(const ScopedFd &) = delete;

        ScopedFd(ScopedFd &&other) noexcept : m_fd(other.Release()) {}
        ScopedFd &operator=(ScopedFd &&other) noexcept
        {
            if (this != &other)
                Reset(other.Release());
            return *this;
        }

        int Get() const { return m_fd; }
        bool Valid() const { return m_fd >= 0; }

        int Release()
        {
            int fd = m_fd;
            m_fd = -1;
            return fd;
        }

        void Reset(int fd = -1);

    private:
        int m_fd = -1;
    };

    bool IsRoot();

    bool SetNonBlocking(int fd, bool enabled);

    // Waits until fd is ready for `events`; false on timeout or error.
    bool WaitFd(int fd, short events, int timeout_ms);

    // Applies SO_RCVTIMEO and SO_SNDTIMEO.
    void SetIoTimeout(int fd, std::chrono::milliseconds timeout);

    // Fills storage from an IPv4 or IPv6 literal. Scoped link-local ("fe80::1%eth0") is accepted.
    bool MakeSockAddr(const std::string &address, std::uint16_t port, sockaddr_storage &storage, socklen_t &length);

    // Non-blocking connect bounded by timeout. Returns a connected blocking socket or nullopt.
    std::optional<ScopedFd> ConnectWithTimeout(const std::string &address, std::uint16_t port,
                                               std::chrono::milliseconds timeout);

    // Address of a received datagram as text.
    std::string SockAddrToString(const sockaddr_storage &storage);

    struct Datagram
    {
        std::string source;
        std::vector<std::uint8_t> payload;
    };

    // Reads every datagram arriving on fd until the deadline passes.
    std::vector<Datagram> ReceiveUntil(int fd, std::chrono::steady_clock::time_point deadline,
                                       std::size_t max_size = 9000);
}
