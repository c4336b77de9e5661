#pragma once

#include <optional>
#include <string>

namespace net_scan::probes
{
    // Vendor for the first three octets of a MAC. "Unknown" for an unlisted OUI,
    // nullopt when the input is not a MAC address at all. Case-insensitive; ':' or '-'.
    std::optional<std::string> LookupVendor(const std::string &mac);
}
