#pragma once

#include "../engine/Probe.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace net_scan::probes
{
    // Headers of interest from an SSDP search response or NOTIFY.
    struct SsdpResponse
    {
        std::string location;
        std::string server;
        std::string usn;
        std::string st;
    };

    struct UpnpDevice
    {
        std::string friendly_name = "UPnP Device";
        std::string device_type = "UPnP Device";
        std::string manufacturer = "Unknown";
        std::string model = "Unknown";
        std::string services = "UPnP";
        std::string location;
        std::string server;
    };

    std::string SsdpSearchRequest();

    // nullopt unless the message carries a LOCATION header.
    std::optional<SsdpResponse> ParseSsdpResponse(const std::string &raw);

    // Reads friendlyName, deviceType, manufacturer and modelName. nullopt when
    // neither friendlyName nor deviceType is present.
    std::optional<UpnpDevice> ParseDeviceDescription(const std::string &xml);

    // Guesses from the SERVER and USN headers when no description is reachable.
    UpnpDevice DeviceFromSsdp(const SsdpResponse &response);

    std::string SimplifyDeviceType(const std::string &urn);
    std::string DeviceTypeFromServer(const std::string &server);
    std::string ManufacturerFromServer(const std::string &server);
    std::string ModelFromServer(const std::string &server);
    std::string FriendlyNameFromServer(const std::string &server, const std::string &usn);

    // SSDP discovery. The batch issues one multicast search and only probes the
    // silent targets individually.
    class UpnpProbe : public engine::Probe
    {
    public:
        explicit UpnpProbe(engine::ProbeConfig config) : Probe(std::move(config)) {}

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Upnp; }
        std::string Name() const override { return "UPnP/SSDP"; }
        std::string Description() const override { return "Finds UPnP devices through SSDP search and device descriptions"; }
        int Priority() const override { return 3; }

        bool IsAvailable() override;

        // Unicast path only: SSDP to port 1900, then well-known description URLs.
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;
        std::vector<engine::ProbeResult> ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                    const engine::BatchCallbacks &callbacks) override;

    private:
        UpnpDevice Describe(const SsdpResponse &response, std::chrono::milliseconds budget);
        std::optional<UpnpDevice> Detect(const std::string &address);
        engine::ProbeResult ToResult(const engine::ScanTarget &target, const UpnpDevice &device, double latency_ms) const;
    };
}
