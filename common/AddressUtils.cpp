#include "AddressUtils.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdexcept>

namespace net_scan::common
{
    bool IsIpv4(const std::string &address)
    {
        in_addr addr{};
        return inet_pton(AF_INET, address.c_str(), &addr) == 1;
    }

    bool IsIpv6(const std::string &address)
    {
        std::string host = address.substr(0, address.find('%'));
        in6_addr addr{};
        return inet_pton(AF_INET6, host.c_str(), &addr) == 1;
    }

    std::optional<std::uint32_t> Ipv4ToInt(const std::string &address)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, address.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string IntToIpv4(std::uint32_t value)
    {
        in_addr addr{};
        addr.s_addr = htonl(value);
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &addr, buf, sizeof(buf));
        return buf;
    }

    std::optional<int> LastOctet(const std::string &address)
    {
        auto value = Ipv4ToInt(address);
        if (!value)
            return std::nullopt;
        return static_cast<int>(*value & 0xFF);
    }

    std::optional<std::string> Ipv4Prefix24(const std::string &address)
    {
        if (!IsIpv4(address))
            return std::nullopt;
        return address.substr(0, address.find_last_of('.'));
    }

    std::vector<std::string> NeighborAddresses(const std::string &address, int radius)
    {
        std::vector<std::string> out;
        auto octet = LastOctet(address);
        auto prefix = Ipv4Prefix24(address);
        if (!octet || !prefix)
            return out;

        for (int offset = -radius; offset <= radius; ++offset)
        {
            int candidate = *octet + offset;
            if (offset == 0 || candidate < 1 || candidate > 254)
                continue;
            out.push_back(*prefix + "." + std::to_string(candidate));
        }
        return out;
    }

    std::optional<std::vector<std::string>> ExpandTargetSpec(const std::string &spec)
    {
        auto slash = spec.find('/');
        if (slash == std::string::npos)
        {
            if (IsIpv4(spec) || IsIpv6(spec))
                return std::vector<std::string>{spec};
            return std::nullopt;
        }

        auto base = Ipv4ToInt(spec.substr(0, slash));
        if (!base)
            return std::nullopt;

        int prefix = 0;
        try
        {
            prefix = std::stoi(spec.substr(slash + 1));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
        if (prefix < 16 || prefix > 32)
            return std::nullopt;

        const std::uint32_t mask = 0xFFFFFFFFu << (32 - prefix);
        const std::uint32_t network = *base & mask;
        const std::uint32_t broadcast = network | ~mask;

        std::vector<std::string> out;
        if (prefix >= 31)
        {
            for (std::uint64_t v = network; v <= broadcast; ++v)
                out.push_back(IntToIpv4(static_cast<std::uint32_t>(v)));
            return out;
        }

        for (std::uint32_t v = network + 1; v < broadcast; ++v)
            out.push_back(IntToIpv4(v));
        return out;
    }
}
