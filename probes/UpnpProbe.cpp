#include "UpnpProbe.hpp"
#include "TcpProbe.hpp"
#include "../common/HttpClient.hpp"
#include "../common/Log.hpp"
#include "../common/SocketUtils.hpp"
#include "../engine/Deadline.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <map>
#include <mutex>
#include <netinet/in.h>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;
    using engine::Remaining;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr const char *SSDP_GROUP = "239.255.255.250";
        constexpr std::uint16_t SSDP_PORT = 1900;
        constexpr auto RECEIVE_SLICE = std::chrono::milliseconds(100);
        constexpr auto DESCRIPTION_TIMEOUT = std::chrono::milliseconds(2000);
        constexpr auto PORT_CHECK_TIMEOUT = std::chrono::milliseconds(1000);

        const std::vector<std::string> &DescriptionPaths()
        {
            static const std::vector<std::string> paths = {
                "/rootDesc.xml", "/description.xml", "/device.xml", "/upnp/desc.xml"};
            return paths;
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool Contains(const std::string &haystack, const char *needle)
        {
            return haystack.find(needle) != std::string::npos;
        }

        std::optional<std::string> ElementText(const std::string &xml, const std::string &tag)
        {
            const std::string open = "<" + tag + ">";
            const std::string close = "</" + tag + ">";
            auto begin = xml.find(open);
            if (begin == std::string::npos)
                return std::nullopt;
            begin += open.size();
            auto end = xml.find(close, begin);
            if (end == std::string::npos)
                return std::nullopt;
            return xml.substr(begin, end - begin);
        }

        common::ScopedFd OpenSearchSocket()
        {
            common::ScopedFd fd(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
            if (!fd.Valid())
                return fd;

            sockaddr_in local{};
            local.sin_family = AF_INET;
            local.sin_addr.s_addr = htonl(INADDR_ANY);
            if (bind(fd.Get(), reinterpret_cast<sockaddr *>(&local), sizeof(local)) != 0)
            {
                fd.Reset();
                return fd;
            }
            unsigned char ttl = 4;
            setsockopt(fd.Get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
            return fd;
        }

        bool SendSearch(int fd, const std::string &address, std::uint16_t port)
        {
            sockaddr_storage storage{};
            socklen_t length = 0;
            if (!common::MakeSockAddr(address, port, storage, length))
                return false;
            const std::string request = SsdpSearchRequest();
            return sendto(fd, request.data(), request.size(), 0, reinterpret_cast<sockaddr *>(&storage), length) >= 0;
        }
    }

    std::string SsdpSearchRequest()
    {
        return "M-SEARCH * HTTP/1.1\r\n"
               "HOST: 239.255.255.250:1900\r\n"
               "MAN: \"ssdp:discover\"\r\n"
               "ST: upnp:rootdevice\r\n"
               "MX: 3\r\n\r\n";
    }

    std::optional<SsdpResponse> ParseSsdpResponse(const std::string &raw)
    {
        auto message = common::ParseHttpResponse(raw);
        if (!message)
            return std::nullopt;

        SsdpResponse response;
        response.location = message->Header("location");
        if (response.location.empty())
            return std::nullopt;
        response.server = message->Header("server");
        response.usn = message->Header("usn");
        response.st = message->Header("st", message->Header("nt"));
        return response;
    }

    std::optional<UpnpDevice> ParseDeviceDescription(const std::string &xml)
    {
        auto friendly_name = ElementText(xml, "friendlyName");
        auto device_type = ElementText(xml, "deviceType");
        if (!friendly_name && !device_type)
            return std::nullopt;

        UpnpDevice device;
        if (friendly_name)
            device.friendly_name = *friendly_name;
        device.device_type = SimplifyDeviceType(device_type.value_or(""));
        device.manufacturer = ElementText(xml, "manufacturer").value_or("Unknown");
        device.model = ElementText(xml, "modelName").value_or("Unknown");
        device.services = "UPnP,HTTP";
        return device;
    }

    std::string SimplifyDeviceType(const std::string &urn)
    {
        if (Contains(urn, "InternetGatewayDevice"))
            return "Router/Gateway";
        if (Contains(urn, "MediaServer"))
            return "Media Server";
        if (Contains(urn, "MediaRenderer"))
            return "Media Renderer";
        if (Contains(urn, "Printer"))
            return "Printer";
        return "UPnP Device";
    }

    std::string DeviceTypeFromServer(const std::string &server)
    {
        const std::string s = Lower(server);
        if (Contains(s, "router") || Contains(s, "gateway"))
            return "Router/Gateway";
        if (Contains(s, "printer"))
            return "Printer";
        if (Contains(s, "media") || Contains(s, "dlna"))
            return "Media Server";
        if (Contains(s, "nas") || Contains(s, "storage"))
            return "NAS/Storage";
        if (Contains(s, "camera") || Contains(s, "webcam"))
            return "IP Camera";
        if (Contains(s, "tv") || Contains(s, "smart"))
            return "Smart TV";
        return "UPnP Device";
    }

    std::string ManufacturerFromServer(const std::string &server)
    {
        static const std::vector<std::pair<const char *, const char *>> vendors = {
            {"linux", "Linux"},
            {"windows", "Microsoft"},
            {"upnp", "Generic UPnP"},
            {"miniupnpd", "MiniUPnP"},
            {"igd", "Internet Gateway Device"},
            {"fritz", "AVM Fritz"},
            {"netgear", "Netgear"},
            {"linksys", "Linksys"},
            {"dlink", "D-Link"},
            {"tplink", "TP-Link"},
            {"asus", "ASUS"},
        };

        const std::string s = Lower(server);
        for (const auto &[key, name] : vendors)
        {
            if (Contains(s, key))
                return name;
        }
        return "Unknown";
    }

    std::string ModelFromServer(const std::string &server)
    {
        auto digits_end = [&](std::size_t i)
        {
            while (i < server.size() && std::isdigit(static_cast<unsigned char>(server[i])))
                ++i;
            return i;
        };

        for (std::size_t i = 0; i < server.size(); ++i)
        {
            if (!std::isdigit(static_cast<unsigned char>(server[i])))
                continue;
            std::size_t major_end = digits_end(i);
            if (major_end >= server.size() || server[major_end] != '.')
                continue;
            std::size_t minor_end = digits_end(major_end + 1);
            if (minor_end == major_end + 1)
                continue;
            std::size_t end = minor_end;
            if (end < server.size() && server[end] == '.')
            {
                std::size_t patch_end = digits_end(end + 1);
                if (patch_end > end + 1)
                    end = patch_end;
            }
            return "v" + server.substr(i, end - i);
        }
        return "Unknown";
    }

    std::string FriendlyNameFromServer(const std::string &server, const std::string &usn)
    {
        auto is_alpha = [](char c)
        { return std::isalpha(static_cast<unsigned char>(c)) != 0; };

        // first alphabetic word followed by whitespace or '/'
        for (std::size_t i = 0; i < server.size();)
        {
            if (!is_alpha(server[i]))
            {
                ++i;
                continue;
            }
            std::size_t end = i;
            while (end < server.size() && is_alpha(server[end]))
                ++end;
            if (end < server.size() && (server[end] == '/' || std::isspace(static_cast<unsigned char>(server[end]))))
                return server.substr(i, end - i);
            i = end;
        }

        std::size_t lead = 0;
        while (lead < server.size() && (std::isalnum(static_cast<unsigned char>(server[lead])) || server[lead] == '-'))
            ++lead;
        if (lead > 0)
            return server.substr(0, lead);

        auto separator = usn.find("::");
        if (separator != std::string::npos)
        {
            std::string uuid = usn.substr(0, separator);
            if (uuid.rfind("uuid:", 0) == 0)
                uuid.erase(0, 5);
            if (!uuid.empty())
                return uuid.substr(0, 8);
        }
        return "UPnP Device";
    }

    UpnpDevice DeviceFromSsdp(const SsdpResponse &response)
    {
        UpnpDevice device;
        device.friendly_name = FriendlyNameFromServer(response.server, response.usn);
        device.device_type = DeviceTypeFromServer(response.server);
        device.manufacturer = ManufacturerFromServer(response.server);
        device.model = ModelFromServer(response.server);
        device.location = response.location;
        device.server = response.server;
        return device;
    }

    bool UpnpProbe::IsAvailable()
    {
        return OpenSearchSocket().Valid();
    }

    UpnpDevice UpnpProbe::Describe(const SsdpResponse &response, std::chrono::milliseconds budget)
    {
        if (budget.count() > 0)
        {
            auto url = common::ParseHttpUrl(response.location);
            if (url)
            {
                auto reply = common::HttpGet(*url, std::min(budget, DESCRIPTION_TIMEOUT));
                if (reply && reply->status_code == 200)
                {
                    auto device = ParseDeviceDescription(reply->body);
                    if (device)
                    {
                        device->location = response.location;
                        device->server = response.server;
                        return *device;
                    }
                }
            }
        }
        return DeviceFromSsdp(response);
    }

    std::optional<UpnpDevice> UpnpProbe::Detect(const std::string &address)
    {
        const auto deadline = Clock::now() + m_config.timeout;

        common::ScopedFd fd = OpenSearchSocket();
        if (fd.Valid() && SendSearch(fd.Get(), address, SSDP_PORT))
        {
            auto replies = common::ReceiveUntil(fd.Get(), Clock::now() + m_config.timeout / 2);
            for (const auto &reply : replies)
            {
                if (reply.source != address)
                    continue;
                auto response = ParseSsdpResponse(std::string(reply.payload.begin(), reply.payload.end()));
                if (response)
                    return Describe(*response, Remaining(deadline));
            }
        }

        std::vector<std::uint16_t> http_ports;
        auto open = SweepPorts(address, {1900, 49152, 49153, 49154}, std::min(Remaining(deadline), PORT_CHECK_TIMEOUT));
        for (auto port : open)
        {
            if (port != SSDP_PORT)
                http_ports.push_back(port);
        }
        http_ports.push_back(80);

        for (auto port : http_ports)
        {
            for (const auto &path : DescriptionPaths())
            {
                auto budget = Remaining(deadline);
                if (budget.count() == 0)
                    return std::nullopt;
                auto reply = common::HttpGet(address, port, path, false, std::min(budget, DESCRIPTION_TIMEOUT));
                if (!reply || reply->status_code != 200)
                    continue;
                auto device = ParseDeviceDescription(reply->body);
                if (device)
                {
                    device->location = "http://" + address + ":" + std::to_string(port) + path;
                    return device;
                }
            }
        }
        return std::nullopt;
    }

    engine::ProbeResult UpnpProbe::ToResult(const engine::ScanTarget &target, const UpnpDevice &device,
                                            double latency_ms) const
    {
        auto result = engine::MakeResult(target, Kind(), latency_ms);
        result.hostname = device.friendly_name;
        result.metadata["upnp_available"] = "true";
        result.metadata["device_type"] = device.device_type;
        result.metadata["manufacturer"] = device.manufacturer;
        result.metadata["model"] = device.model;
        result.metadata["services"] = device.services;
        if (!device.location.empty())
            result.metadata["location"] = device.location;
        if (!device.server.empty())
            result.metadata["server"] = device.server;
        return result;
    }

    std::optional<engine::ProbeResult> UpnpProbe::ProbeOne(const engine::ScanTarget &target)
    {
        const auto start = Clock::now();
        auto device = Detect(target.address);
        if (!device)
            return std::nullopt;
        std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        return ToResult(target, *device, elapsed.count());
    }

    std::vector<engine::ProbeResult> UpnpProbe::ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                           const engine::BatchCallbacks &callbacks)
    {
        std::vector<engine::ProbeResult> results;
        if (targets.empty())
            return results;

        BatchReporter reporter(callbacks, Kind(), targets.size());
        const auto start = Clock::now();

        std::map<std::string, SsdpResponse> announced;
        common::ScopedFd fd = OpenSearchSocket();
        if (fd.Valid() && SendSearch(fd.Get(), SSDP_GROUP, SSDP_PORT))
        {
            const auto deadline = start + m_config.timeout;
            while (Clock::now() < deadline && !callbacks.Aborted())
            {
                auto replies = common::ReceiveUntil(fd.Get(), std::min(deadline, Clock::now() + RECEIVE_SLICE));
                for (const auto &reply : replies)
                {
                    auto response = ParseSsdpResponse(std::string(reply.payload.begin(), reply.payload.end()));
                    if (response)
                        announced.emplace(reply.source, *response);
                }
            }
        }
        else
        {
            Log(LogLevel::Debug, "Upnp") << "multicast search unavailable, probing targets individually";
        }
        Log(LogLevel::Debug, "Upnp") << announced.size() << " devices answered the multicast search";
        std::chrono::duration<double, std::milli> search_time = Clock::now() - start;

        std::mutex results_mutex;
        ForEachTarget(targets, callbacks, [&](const engine::ScanTarget &target)
                      {
                          const auto begin = Clock::now();
                          std::optional<UpnpDevice> device;
                          double latency = 0.0;

                          auto hit = announced.find(target.address);
                          if (hit != announced.end())
                          {
                              device = Describe(hit->second, m_config.timeout);
                              latency = search_time.count();
                          }
                          else
                          {
                              device = Detect(target.address);
                              std::chrono::duration<double, std::milli> elapsed = Clock::now() - begin;
                              latency = elapsed.count();
                          }

                          reporter.Attempt(latency, device.has_value());
                          if (device)
                          {
                              auto result = ToResult(target, *device, latency);
                              reporter.Result(result);
                              std::lock_guard<std::mutex> lock(results_mutex);
                              results.push_back(std::move(result));
                          }
                          reporter.Completed(target.address); });
        return results;
    }
}
