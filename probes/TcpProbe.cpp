#include "TcpProbe.hpp"
#include "../common/HttpClient.hpp"
#include "../common/Log.hpp"
#include "../common/SocketUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <system_error>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr auto MAX_PORT_TIMEOUT = std::chrono::milliseconds(800);
        constexpr auto MIN_BANNER_BUDGET = std::chrono::milliseconds(50);
        constexpr std::size_t BANNER_BODY_LIMIT = 4096;

        struct PendingConnect
        {
            common::ScopedFd fd;
            std::uint16_t port;
        };

        std::optional<PendingConnect> StartConnect(const std::string &address, std::uint16_t port)
        {
            sockaddr_storage storage{};
            socklen_t length = 0;
            if (!common::MakeSockAddr(address, port, storage, length))
                return std::nullopt;

            common::ScopedFd fd(socket(storage.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0));
            if (!fd.Valid() || !common::SetNonBlocking(fd.Get(), true))
                return std::nullopt;

            if (connect(fd.Get(), reinterpret_cast<sockaddr *>(&storage), length) != 0 && errno != EINPROGRESS)
                return std::nullopt;
            return PendingConnect{std::move(fd), port};
        }

        const char *Flag(bool v)
        {
            return v ? "true" : "false";
        }
    }

    const std::vector<std::uint16_t> &DefaultTcpPorts()
    {
        static const std::vector<std::uint16_t> ports = {
            22, 23, 25, 53, 80, 110, 143, 443, 993, 995,
            1433, 3306, 3389, 5432, 8080, 8443, 9000, 3000, 5000, 8000};
        return ports;
    }

    std::optional<std::string> TcpServiceName(std::uint16_t port)
    {
        switch (port)
        {
        case 22:
            return "SSH";
        case 23:
            return "Telnet";
        case 25:
            return "SMTP";
        case 53:
            return "DNS";
        case 80:
            return "HTTP";
        case 110:
            return "POP3";
        case 143:
            return "IMAP";
        case 443:
            return "HTTPS";
        case 993:
            return "IMAPS";
        case 995:
            return "POP3S";
        case 1433:
            return "SQL Server";
        case 3306:
            return "MySQL";
        case 3389:
            return "RDP";
        case 5432:
            return "PostgreSQL";
        case 8080:
            return "HTTP (Alt)";
        case 8443:
            return "HTTPS (Alt)";
        case 9000:
            return "Development";
        case 3000:
            return "Node.js";
        case 5000:
            return "Flask";
        case 8000:
            return "Django";
        default:
            return std::nullopt;
        }
    }

    std::vector<std::uint16_t> ParsePortList(const std::string &list)
    {
        std::vector<std::uint16_t> ports;
        std::stringstream ss(list);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            try
            {
                std::size_t used = 0;
                int value = std::stoi(item, &used);
                if (value > 0 && value <= 65535 && item.find_first_not_of(" \t", used) == std::string::npos)
                    ports.push_back(static_cast<std::uint16_t>(value));
            }
            catch (const std::exception &)
            {
                Log(LogLevel::Debug, "Tcp") << "ignoring port entry '" << item << "'";
            }
        }
        return ports;
    }

    std::set<std::uint16_t> SweepPorts(const std::string &address, const std::vector<std::uint16_t> &ports,
                                       std::chrono::milliseconds timeout)
    {
        std::set<std::uint16_t> open;
        std::vector<PendingConnect> pending;
        pending.reserve(ports.size());

        for (auto port : ports)
        {
            auto attempt = StartConnect(address, port);
            if (attempt)
                pending.push_back(std::move(*attempt));
        }

        const auto deadline = Clock::now() + timeout;
        while (!pending.empty())
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (remaining <= 0)
                break;

            std::vector<pollfd> fds(pending.size());
            for (std::size_t i = 0; i < pending.size(); ++i)
            {
                fds[i].fd = pending[i].fd.Get();
                fds[i].events = POLLOUT;
            }

            int ready = poll(fds.data(), fds.size(), static_cast<int>(remaining));
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (ready == 0)
                break;

            std::vector<PendingConnect> still;
            for (std::size_t i = 0; i < pending.size(); ++i)
            {
                if (fds[i].revents == 0)
                {
                    still.push_back(std::move(pending[i]));
                    continue;
                }
                int err = 0;
                socklen_t len = sizeof(err);
                if (getsockopt(fds[i].fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0)
                    open.insert(pending[i].port);
            }
            pending.swap(still);
        }
        return open;
    }

    TcpProbe::TcpProbe(engine::ProbeConfig config) : Probe(std::move(config))
    {
        const std::string override_ports = m_config.Param("ports");
        if (!override_ports.empty())
            m_ports = ParsePortList(override_ports);
        if (m_ports.empty())
            m_ports = DefaultTcpPorts();
    }

    bool TcpProbe::IsAvailable()
    {
        common::ScopedFd fd(socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
        return fd.Valid();
    }

    std::optional<engine::ProbeResult> TcpProbe::ProbeOne(const engine::ScanTarget &target)
    {
        const auto start = Clock::now();
        const auto deadline = start + m_config.timeout;

        auto open = SweepPorts(target.address, m_ports, std::min(m_config.timeout, std::chrono::milliseconds(MAX_PORT_TIMEOUT)));
        if (open.empty())
            return std::nullopt;

        std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        auto result = engine::MakeResult(target, Kind(), elapsed.count());
        result.open_ports = open;

        for (auto port : open)
        {
            auto name = TcpServiceName(port);
            result.metadata["service." + std::to_string(port)] = name ? *name : "Unknown";
        }
        result.metadata["open_port_count"] = std::to_string(open.size());
        result.metadata["website_available"] = Flag(open.count(80) || open.count(443));
        result.metadata["ssh_available"] = Flag(open.count(22) > 0);
        result.metadata["database_available"] = Flag(open.count(1433) || open.count(3306) || open.count(5432));

        std::vector<std::pair<std::uint16_t, std::future<std::optional<common::HttpResponse>>>> banners;
        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (budget >= MIN_BANNER_BUDGET)
        {
            for (std::uint16_t port : {std::uint16_t(80), std::uint16_t(443)})
            {
                if (!open.count(port))
                    continue;
                const std::string address = target.address;
                try
                {
                    banners.emplace_back(port, std::async(std::launch::async, [address, port, budget]()
                                                          { return common::HttpGet(address, port, "/", port == 443, budget, BANNER_BODY_LIMIT); }));
                }
                catch (const std::system_error &e)
                {
                    Log(LogLevel::Debug, "Tcp") << "banner fetch for " << address << ':' << port << " skipped: " << e.what();
                }
            }
        }

        for (auto &[port, future] : banners)
        {
            auto response = future.get();
            if (!response)
                continue;
            const std::string prefix = "http." + std::to_string(port) + ".";
            result.metadata[prefix + "status"] = std::to_string(response->status_code);
            result.metadata[prefix + "server"] = response->Header("server", "Unknown");
            result.metadata[prefix + "content_type"] = response->Header("content-type", "Unknown");
        }

        return result;
    }
}
