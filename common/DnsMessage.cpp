#include "DnsMessage.hpp"
#include "Codec.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace net_scan::common::dns
{
    namespace
    {
        constexpr int MAX_POINTER_JUMPS = 16;

        std::optional<ResourceRecord> ReadRecord(const std::vector<std::uint8_t> &packet, std::size_t &offset)
        {
            ResourceRecord rr;
            auto name = ReadName(packet, offset);
            if (!name)
                return std::nullopt;
            rr.name = *name;

            std::uint16_t rdlength = 0;
            if (!wire::read_u16_be(packet, offset, rr.type) ||
                !wire::read_u16_be(packet, offset, rr.klass) ||
                !wire::read_u32_be(packet, offset, rr.ttl) ||
                !wire::read_u16_be(packet, offset, rdlength))
                return std::nullopt;

            const std::size_t rdata = offset;
            const std::size_t end = rdata + rdlength;
            if (end > packet.size())
                return std::nullopt;

            switch (rr.type)
            {
            case TYPE_PTR:
            {
                std::size_t pos = rdata;
                auto target = ReadName(packet, pos);
                if (target)
                    rr.target = *target;
                break;
            }
            case TYPE_SRV:
            {
                std::size_t pos = rdata;
                if (rdlength < 6 ||
                    !wire::read_u16_be(packet, pos, rr.priority) ||
                    !wire::read_u16_be(packet, pos, rr.weight) ||
                    !wire::read_u16_be(packet, pos, rr.port))
                    break;
                auto target = ReadName(packet, pos);
                if (target)
                    rr.target = *target;
                break;
            }
            case TYPE_A:
                if (rdlength == 4)
                {
                    char buf[INET_ADDRSTRLEN] = {};
                    inet_ntop(AF_INET, packet.data() + rdata, buf, sizeof(buf));
                    rr.address = buf;
                }
                break;
            case TYPE_AAAA:
                if (rdlength == 16)
                {
                    char buf[INET6_ADDRSTRLEN] = {};
                    inet_ntop(AF_INET6, packet.data() + rdata, buf, sizeof(buf));
                    rr.address = buf;
                }
                break;
            case TYPE_TXT:
            {
                std::size_t pos = rdata;
                while (pos < end)
                {
                    std::uint8_t len = packet[pos++];
                    if (pos + len > end)
                        break;
                    rr.txt.emplace_back(reinterpret_cast<const char *>(packet.data() + pos), len);
                    pos += len;
                }
                break;
            }
            default:
                break;
            }

            offset = end;
            return rr;
        }
    }

    std::vector<ResourceRecord> Message::AllRecords() const
    {
        std::vector<ResourceRecord> all;
        all.reserve(answers.size() + authorities.size() + additionals.size());
        all.insert(all.end(), answers.begin(), answers.end());
        all.insert(all.end(), authorities.begin(), authorities.end());
        all.insert(all.end(), additionals.begin(), additionals.end());
        return all;
    }

    std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::vector<Question> &questions, bool recursion_desired)
    {
        std::vector<std::uint8_t> packet;
        packet.reserve(HEADER_SIZE + questions.size() * 32);

        wire::append_u16_be(packet, id);
        wire::append_u16_be(packet, recursion_desired ? 0x0100 : 0x0000);
        wire::append_u16_be(packet, static_cast<std::uint16_t>(questions.size()));
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);
        wire::append_u16_be(packet, 0);

        for (const auto &q : questions)
        {
            if (!wire::append_dns_name(packet, q.name))
                return {};
            wire::append_u16_be(packet, q.type);
            wire::append_u16_be(packet, q.klass);
        }
        return packet;
    }

    std::optional<std::string> ReadName(const std::vector<std::uint8_t> &packet, std::size_t &offset)
    {
        std::string out;
        std::size_t pos = offset;
        bool jumped = false;
        int jumps = 0;

        while (true)
        {
            if (pos >= packet.size())
                return std::nullopt;

            std::uint8_t len = packet[pos];
            if (len == 0)
            {
                ++pos;
                break;
            }

            if ((len & 0xC0) == 0xC0)
            {
                if (pos + 1 >= packet.size() || ++jumps > MAX_POINTER_JUMPS)
                    return std::nullopt;

                std::size_t pointer = (static_cast<std::size_t>(len & 0x3F) << 8) | packet[pos + 1];
                if (!jumped)
                    offset = pos + 2;
                jumped = true;
                pos = pointer;
                continue;
            }

            if ((len & 0xC0) != 0)
                return std::nullopt;

            ++pos;
            if (pos + len > packet.size())
                return std::nullopt;

            if (!out.empty())
                out.push_back('.');
            out.append(reinterpret_cast<const char *>(packet.data() + pos), len);
            pos += len;
        }

        if (!jumped)
            offset = pos;
        return out;
    }

    std::optional<Message> DecodeMessage(const std::vector<std::uint8_t> &packet)
    {
        Message msg;
        std::size_t offset = 0;
        std::uint16_t qd = 0, an = 0, ns = 0, ar = 0;

        if (!wire::read_u16_be(packet, offset, msg.id) ||
            !wire::read_u16_be(packet, offset, msg.flags) ||
            !wire::read_u16_be(packet, offset, qd) ||
            !wire::read_u16_be(packet, offset, an) ||
            !wire::read_u16_be(packet, offset, ns) ||
            !wire::read_u16_be(packet, offset, ar))
            return std::nullopt;

        for (std::uint16_t i = 0; i < qd; ++i)
        {
            Question q;
            auto name = ReadName(packet, offset);
            if (!name || !wire::read_u16_be(packet, offset, q.type) || !wire::read_u16_be(packet, offset, q.klass))
                return std::nullopt;
            q.name = *name;
            msg.questions.push_back(std::move(q));
        }

        auto read_section = [&](std::uint16_t count, std::vector<ResourceRecord> &into) -> bool
        {
            for (std::uint16_t i = 0; i < count; ++i)
            {
                auto rr = ReadRecord(packet, offset);
                if (!rr)
                    return false;
                into.push_back(std::move(*rr));
            }
            return true;
        };

        if (!read_section(an, msg.answers) ||
            !read_section(ns, msg.authorities) ||
            !read_section(ar, msg.additionals))
            return std::nullopt;

        return msg;
    }

    std::string CanonicalName(const std::string &name)
    {
        std::size_t n = name.size();
        while (n > 0 && name[n - 1] == '.')
            --n;

        std::string out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i)
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
        return out;
    }

    std::string ReverseLookupName(const std::string &ipv4)
    {
        std::vector<std::string> octets;
        std::stringstream ss(ipv4);
        std::string part;
        while (std::getline(ss, part, '.'))
            octets.push_back(part);

        std::string out;
        for (auto it = octets.rbegin(); it != octets.rend(); ++it)
        {
            out += *it;
            out += '.';
        }
        out += "in-addr.arpa";
        return out;
    }
}
