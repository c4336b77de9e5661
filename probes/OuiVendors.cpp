#include "OuiVendors.hpp"
#include "../common/TextParsers.hpp"

#include <unordered_map>

namespace net_scan::probes
{
    namespace
    {
        const std::unordered_map<std::string, std::string> &OuiTable()
        {
            static const std::unordered_map<std::string, std::string> table = {
                {"00:1b:63", "Apple"},
                {"00:25:00", "Apple"},
                {"00:26:08", "Apple"},
                {"3c:15:c2", "Apple"},
                {"00:50:56", "VMware"},
                {"00:0c:29", "VMware"},
                {"08:00:27", "VirtualBox"},
                {"00:15:5d", "Microsoft"},
                {"00:1c:42", "Parallels"},
                {"00:e0:4c", "Realtek"},
                {"00:1a:a0", "Netgear"},
                {"00:24:01", "D-Link"},
                {"00:26:5a", "Linksys"},
                {"00:11:22", "Cisco"},
                {"00:d0:c9", "Intel"},
                {"00:a0:c9", "Intel"},
                {"00:1b:21", "Intel"},
                {"00:1c:f0", "Dell"},
                {"00:25:64", "HP"},
                {"00:1e:58", "WD"},
            };
            return table;
        }
    }

    std::optional<std::string> LookupVendor(const std::string &mac)
    {
        auto normalized = common::parsers::NormalizeMac(mac);
        if (!normalized)
            return std::nullopt;

        auto it = OuiTable().find(normalized->substr(0, 8));
        if (it == OuiTable().end())
            return std::string("Unknown");
        return it->second;
    }
}
