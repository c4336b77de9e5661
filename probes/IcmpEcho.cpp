#include "IcmpEcho.hpp"
#include "../common/AddressUtils.hpp"
#include "../common/Log.hpp"
#include "../common/TextParsers.hpp"

#include <tins/tins.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;

    namespace
    {
        std::atomic<std::uint16_t> g_echo_sequence{1};

        std::uint16_t NextSequence()
        {
            return g_echo_sequence.fetch_add(1);
        }

        std::uint16_t EchoId()
        {
            return static_cast<std::uint16_t>(getpid() & 0xFFFF);
        }

        double ElapsedMs(std::chrono::steady_clock::time_point start)
        {
            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
            return elapsed.count();
        }

        EchoResult EchoV4(const std::string &address, std::chrono::milliseconds timeout)
        {
            EchoResult out;
            const auto ms = static_cast<std::uint32_t>(timeout.count());

            Tins::PacketSender sender(Tins::NetworkInterface(), ms / 1000, (ms % 1000) * 1000);
            Tins::IP request = Tins::IP(address) / Tins::ICMP();
            Tins::ICMP &icmp = request.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(EchoId());
            icmp.sequence(NextSequence());

            const auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(request));
            if (!reply)
                return out;

            const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
            if (!answer || answer->type() != Tins::ICMP::ECHO_REPLY)
                return out;

            out.outcome = EchoOutcome::Reply;
            out.latency_ms = ElapsedMs(start);
            if (const Tins::IP *ip = reply->find_pdu<Tins::IP>())
                out.ttl = ip->ttl();
            return out;
        }

        EchoResult EchoV6(const std::string &address, std::chrono::milliseconds timeout)
        {
            EchoResult out;
            const auto ms = static_cast<std::uint32_t>(timeout.count());

            std::string bare = address.substr(0, address.find('%'));
            Tins::PacketSender sender(Tins::NetworkInterface(), ms / 1000, (ms % 1000) * 1000);
            Tins::IPv6 request = Tins::IPv6(bare) / Tins::ICMPv6(Tins::ICMPv6::ECHO_REQUEST);
            Tins::ICMPv6 &icmp = request.rfind_pdu<Tins::ICMPv6>();
            icmp.identifier(EchoId());
            icmp.sequence(NextSequence());

            const auto start = std::chrono::steady_clock::now();
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(request));
            if (!reply)
                return out;

            const Tins::ICMPv6 *answer = reply->find_pdu<Tins::ICMPv6>();
            if (!answer || answer->type() != Tins::ICMPv6::ECHO_REPLY)
                return out;

            out.outcome = EchoOutcome::Reply;
            out.latency_ms = ElapsedMs(start);
            if (const Tins::IPv6 *ip = reply->find_pdu<Tins::IPv6>())
                out.ttl = ip->hop_limit();
            return out;
        }
    }

    bool CanOpenRawSocket(bool ipv6)
    {
        int fd = ipv6 ? socket(AF_INET6, SOCK_RAW, IPPROTO_ICMPV6) : socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        if (fd < 0)
            return false;
        close(fd);
        return true;
    }

    EchoResult GuardEcho(const std::string &address, const std::function<EchoResult()> &echo)
    {
        try
        {
            return echo();
        }
        catch (const Tins::socket_open_error &e)
        {
            Log(LogLevel::Debug, "Icmp") << "raw socket unavailable: " << e.what();
            return {EchoOutcome::Unavailable, 0.0, std::nullopt};
        }
        catch (const std::exception &e)
        {
            Log(LogLevel::Debug, "Icmp") << "raw echo to " << address << " failed: " << e.what();
            return {EchoOutcome::NoReply, 0.0, std::nullopt};
        }
    }

    EchoResult RawEcho(const std::string &address, std::chrono::milliseconds timeout)
    {
        if (common::IsIpv4(address))
            return GuardEcho(address, [&]
                             { return EchoV4(address, timeout); });
        if (common::IsIpv6(address))
            return GuardEcho(address, [&]
                             { return EchoV6(address, timeout); });
        return {};
    }

    EchoResult SystemPing(common::CommandRunner &runner, const std::string &address, std::chrono::milliseconds timeout)
    {
        EchoResult out;
        const long wait_s = std::max<long>(1, static_cast<long>((timeout.count() + 999) / 1000));

        std::vector<std::string> argv = {"ping"};
        if (common::IsIpv6(address))
            argv.push_back("-6");
        argv.insert(argv.end(), {"-c", "1", "-W", std::to_string(wait_s), address});

        const auto start = std::chrono::steady_clock::now();
        auto result = runner.Run(argv, timeout);
        if (!result.launched)
        {
            out.outcome = EchoOutcome::Unavailable;
            return out;
        }
        if (!result.Succeeded())
            return out;

        auto reply = common::parsers::ParsePingOutput(result.output);
        out.outcome = EchoOutcome::Reply;
        out.latency_ms = reply.latency_ms.value_or(ElapsedMs(start));
        out.ttl = reply.ttl;
        return out;
    }
}
