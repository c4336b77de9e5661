#pragma once

#include "common/SocketUtils.hpp"

#include <arpa/inet.h>
#include <atomic>
#include <cstdint>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace net_scan::testing
{
    // TCP listener on 127.0.0.1 with an ephemeral port. Every accepted
    // connection gets `reply` (after the request headers when wait_for_request
    // is set) and is then closed.
    class LoopbackServer
    {
    public:
        explicit LoopbackServer(std::string reply = "", bool wait_for_request = false)
            : m_reply(std::move(reply)), m_wait_for_request(wait_for_request)
        {
            m_listener.Reset(socket(AF_INET, SOCK_STREAM, 0));
            int one = 1;
            setsockopt(m_listener.Get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            bind(m_listener.Get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            listen(m_listener.Get(), 16);

            socklen_t len = sizeof(addr);
            getsockname(m_listener.Get(), reinterpret_cast<sockaddr *>(&addr), &len);
            m_port = ntohs(addr.sin_port);

            m_thread = std::thread([this]
                                   { Serve(); });
        }

        ~LoopbackServer()
        {
            m_stop = true;
            if (m_thread.joinable())
                m_thread.join();
        }

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        std::uint16_t Port() const { return m_port; }
        int Accepted() const { return m_accepted.load(); }

    private:
        void Serve()
        {
            while (!m_stop)
            {
                if (!common::WaitFd(m_listener.Get(), POLLIN, 50))
                    continue;
                common::ScopedFd client(accept(m_listener.Get(), nullptr, nullptr));
                if (!client.Valid())
                    continue;
                ++m_accepted;

                if (m_wait_for_request)
                {
                    std::string request;
                    char buf[1024];
                    while (request.find("\r\n\r\n") == std::string::npos &&
                           common::WaitFd(client.Get(), POLLIN, 1000))
                    {
                        ssize_t n = recv(client.Get(), buf, sizeof(buf), 0);
                        if (n <= 0)
                            break;
                        request.append(buf, static_cast<std::size_t>(n));
                    }
                }

                if (!m_reply.empty())
                    send(client.Get(), m_reply.data(), m_reply.size(), MSG_NOSIGNAL);
            }
        }

        std::string m_reply;
        bool m_wait_for_request;
        common::ScopedFd m_listener;
        std::uint16_t m_port = 0;
        std::atomic<bool> m_stop{false};
        std::atomic<int> m_accepted{0};
        std::thread m_thread;
    };
}
