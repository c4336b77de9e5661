#include "TextParsers.hpp"
#include "AddressUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace net_scan::common::parsers
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            auto begin = s.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            auto end = s.find_last_not_of(" \t\r\n");
            return s.substr(begin, end - begin + 1);
        }

        std::string StripTrailingDot(std::string s)
        {
            while (!s.empty() && s.back() == '.')
                s.pop_back();
            return s;
        }

        std::vector<std::string> Tokens(const std::string &line)
        {
            std::vector<std::string> out;
            std::stringstream ss(line);
            std::string tok;
            while (ss >> tok)
                out.push_back(tok);
            return out;
        }

        std::optional<double> NumberAfter(const std::string &text, const std::string &key)
        {
            auto pos = text.find(key);
            if (pos == std::string::npos)
                return std::nullopt;
            pos += key.size();
            // "time<1 ms" on some platforms
            if (pos < text.size() && text[pos] == '<')
                ++pos;
            const char *start = text.c_str() + pos;
            char *end = nullptr;
            double value = std::strtod(start, &end);
            if (end == start)
                return std::nullopt;
            return value;
        }
    }

    PingReply ParsePingOutput(const std::string &output)
    {
        PingReply reply;
        std::stringstream ss(output);
        std::string line;
        while (std::getline(ss, line))
        {
            if (line.find("bytes from") == std::string::npos)
                continue;

            auto time = NumberAfter(line, "time=");
            if (!time)
                time = NumberAfter(line, "time<");
            if (time)
                reply.latency_ms = *time;

            auto ttl = NumberAfter(line, "ttl=");
            if (!ttl)
                ttl = NumberAfter(line, "hlim=");
            if (ttl)
                reply.ttl = static_cast<int>(*ttl);

            if (reply.latency_ms)
                break;
        }
        return reply;
    }

    std::optional<std::string> NormalizeMac(const std::string &raw)
    {
        std::string s = raw;
        std::replace(s.begin(), s.end(), '-', ':');

        std::vector<std::string> parts;
        std::stringstream ss(s);
        std::string part;
        while (std::getline(ss, part, ':'))
            parts.push_back(part);

        if (parts.size() != 6)
            return std::nullopt;

        std::string out;
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            const auto &p = parts[i];
            if (p.empty() || p.size() > 2)
                return std::nullopt;
            for (char c : p)
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;

            if (i > 0)
                out.push_back(':');
            if (p.size() == 1)
                out.push_back('0');
            for (char c : p)
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

    std::vector<ArpEntry> ParseProcNetArp(const std::string &text)
    {
        std::vector<ArpEntry> entries;
        std::stringstream ss(text);
        std::string line;
        std::getline(ss, line); // header

        while (std::getline(ss, line))
        {
            std::stringstream ls(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ls >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            auto normalized = NormalizeMac(mac);
            if (!normalized || *normalized == "00:00:00:00:00:00" || flags == "0x0")
                continue;

            ArpEntry entry;
            entry.ip = ip;
            entry.mac = *normalized;
            entry.interface = dev;
            // ATF_PERM = 0x04
            long f = std::strtol(flags.c_str(), nullptr, 16);
            entry.status = (f & 0x04) ? "permanent" : "dynamic";
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::vector<ArpEntry> ParseArpCommandOutput(const std::string &text)
    {
        std::vector<ArpEntry> entries;
        std::stringstream ss(text);
        std::string line;

        while (std::getline(ss, line))
        {
            auto open = line.find('(');
            auto close = line.find(')', open);
            if (open == std::string::npos || close == std::string::npos)
                continue;

            std::string ip = line.substr(open + 1, close - open - 1);
            if (!IsIpv4(ip))
                continue;

            auto tokens = Tokens(line.substr(close + 1));
            ArpEntry entry;
            entry.ip = ip;
            for (std::size_t i = 0; i < tokens.size(); ++i)
            {
                if (tokens[i] == "at" && i + 1 < tokens.size())
                {
                    auto mac = NormalizeMac(tokens[i + 1]);
                    if (mac)
                        entry.mac = *mac;
                }
                else if (tokens[i] == "on" && i + 1 < tokens.size())
                {
                    entry.interface = tokens[i + 1];
                }
            }

            if (entry.mac.empty() || entry.mac == "00:00:00:00:00:00")
                continue;

            if (line.find("permanent") != std::string::npos || line.find("PERM") != std::string::npos)
                entry.status = "permanent";
            else if (line.find("static") != std::string::npos)
                entry.status = "static";
            else
                entry.status = "dynamic";

            if (entry.interface.empty())
                entry.interface = "unknown";
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::optional<std::string> ParseNslookupOutput(const std::string &output)
    {
        std::stringstream ss(output);
        std::string line;
        while (std::getline(ss, line))
        {
            auto pos = line.find("name =");
            if (pos != std::string::npos)
            {
                auto host = StripTrailingDot(Trim(line.substr(pos + 6)));
                if (!host.empty())
                    return host;
            }
        }

        // Some resolvers print "Name:    host.example" after the server block.
        ss.clear();
        ss.seekg(0);
        bool past_server = false;
        while (std::getline(ss, line))
        {
            std::string t = Trim(line);
            if (t.empty())
            {
                past_server = true;
                continue;
            }
            if (past_server && t.rfind("Name:", 0) == 0)
            {
                auto host = StripTrailingDot(Trim(t.substr(5)));
                if (!host.empty() && host.find("in-addr.arpa") == std::string::npos)
                    return host;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseDigShortOutput(const std::string &output)
    {
        std::stringstream ss(output);
        std::string line;
        while (std::getline(ss, line))
        {
            std::string t = Trim(line);
            if (t.empty() || t[0] == ';')
                continue;
            // dig prints errors such as "connection timed out; no servers could be reached"
            if (t.find(' ') != std::string::npos)
                continue;
            auto host = StripTrailingDot(t);
            if (!host.empty() && !IsIpv4(host))
                return host;
        }
        return std::nullopt;
    }

    std::vector<NeighborEntry> ParseIpNeighOutput(const std::string &text)
    {
        std::vector<NeighborEntry> entries;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line))
        {
            auto tokens = Tokens(line);
            if (tokens.empty() || !IsIpv6(tokens[0]))
                continue;

            NeighborEntry entry;
            entry.address = tokens[0];
            for (std::size_t i = 1; i < tokens.size(); ++i)
            {
                if (tokens[i] == "dev" && i + 1 < tokens.size())
                    entry.interface = tokens[++i];
                else if (tokens[i] == "lladdr" && i + 1 < tokens.size())
                {
                    auto mac = NormalizeMac(tokens[++i]);
                    if (mac)
                        entry.mac = *mac;
                }
            }
            entry.state = tokens.back();

            if (entry.mac.empty() || entry.state == "FAILED" || entry.state == "INCOMPLETE")
                continue;
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::vector<NeighborEntry> ParseNdpOutput(const std::string &text)
    {
        std::vector<NeighborEntry> entries;
        std::stringstream ss(text);
        std::string line;
        while (std::getline(ss, line))
        {
            auto tokens = Tokens(line);
            if (tokens.size() < 3 || !IsIpv6(tokens[0]))
                continue;

            auto mac = NormalizeMac(tokens[1]);
            if (!mac)
                continue;

            NeighborEntry entry;
            entry.address = tokens[0];
            entry.mac = *mac;
            entry.interface = tokens[2];
            if (tokens.size() > 4)
                entry.state = tokens[4];
            entries.push_back(std::move(entry));
        }
        return entries;
    }
}
