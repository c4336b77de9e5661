#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace net_scan::common::wire
{
    inline void append_u16_be(std::vector<std::uint8_t> &out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    inline void append_u32_be(std::vector<std::uint8_t> &out, std::uint32_t value)
    {
        out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    inline bool read_u16_be(const std::vector<std::uint8_t> &in, std::size_t &offset, std::uint16_t &value_out)
    {
        if (offset + 2 > in.size())
            return false;

        value_out = static_cast<std::uint16_t>((static_cast<std::uint16_t>(in[offset]) << 8) |
                                               static_cast<std::uint16_t>(in[offset + 1]));
        offset += 2;
        return true;
    }

    inline bool read_u32_be(const std::vector<std::uint8_t> &in, std::size_t &offset, std::uint32_t &value_out)
    {
        if (offset + 4 > in.size())
            return false;

        value_out = (static_cast<std::uint32_t>(in[offset]) << 24) |
                    (static_cast<std::uint32_t>(in[offset + 1]) << 16) |
                    (static_cast<std::uint32_t>(in[offset + 2]) << 8) |
                    static_cast<std::uint32_t>(in[offset + 3]);
        offset += 4;
        return true;
    }

    // Appends a DNS label sequence ("a.b.local" -> 1a1b5local0). Fails on labels over 63 bytes.
    inline bool append_dns_name(std::vector<std::uint8_t> &out, std::string_view name)
    {
        std::size_t start = 0;
        while (start <= name.size())
        {
            std::size_t dot = name.find('.', start);
            if (dot == std::string_view::npos)
                dot = name.size();

            std::string_view label = name.substr(start, dot - start);
            if (!label.empty())
            {
                if (label.size() > 63)
                    return false;
                out.push_back(static_cast<std::uint8_t>(label.size()));
                out.insert(out.end(), label.begin(), label.end());
            }
            start = dot + 1;
        }
        out.push_back(0);
        return true;
    }
}
