#include "probes/UpnpProbe.hpp"

#include <catch2/catch.hpp>

using namespace net_scan;
using namespace net_scan::probes;
using namespace std::chrono_literals;

namespace
{
    const char *ROUTER_DESCRIPTION =
        "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <device>\n"
        "    <deviceType>urn:schemas-upnp-org:device:InternetGatewayDevice:1</deviceType>\n"
        "    <friendlyName>Home Router</friendlyName>\n"
        "    <manufacturer>Netgear</manufacturer>\n"
        "    <modelName>R7000</modelName>\n"
        "  </device>\n"
        "</root>\n";
}

TEST_CASE("the SSDP search request is an M-SEARCH for root devices", "[probes][upnp]")
{
    REQUIRE(SsdpSearchRequest() ==
            "M-SEARCH * HTTP/1.1\r\n"
            "HOST: 239.255.255.250:1900\r\n"
            "MAN: \"ssdp:discover\"\r\n"
            "ST: upnp:rootdevice\r\n"
            "MX: 3\r\n"
            "\r\n");
}

TEST_CASE("SSDP search responses are parsed", "[probes][upnp]")
{
    auto response = ParseSsdpResponse(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "LOCATION: http://192.168.1.1:49152/rootDesc.xml\r\n"
        "SERVER: Linux/3.14 UPnP/1.0 MiniUPnPd/2.1\r\n"
        "ST: upnp:rootdevice\r\n"
        "USN: uuid:abcd1234-0000-1111-2222-333344445555::upnp:rootdevice\r\n"
        "\r\n");

    REQUIRE(response);
    CHECK(response->location == "http://192.168.1.1:49152/rootDesc.xml");
    CHECK(response->server == "Linux/3.14 UPnP/1.0 MiniUPnPd/2.1");
    CHECK(response->usn == "uuid:abcd1234-0000-1111-2222-333344445555::upnp:rootdevice");
    CHECK(response->st == "upnp:rootdevice");
}

TEST_CASE("SSDP NOTIFY falls back to NT for the search target", "[probes][upnp]")
{
    auto response = ParseSsdpResponse(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "LOCATION: http://192.168.1.40:8080/description.xml\r\n"
        "NT: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "NTS: ssdp:alive\r\n"
        "\r\n");

    REQUIRE(response);
    CHECK(response->st == "urn:schemas-upnp-org:device:MediaRenderer:1");
    CHECK(response->server.empty());
}

TEST_CASE("SSDP messages without a location are ignored", "[probes][upnp]")
{
    REQUIRE_FALSE(ParseSsdpResponse("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"));
    REQUIRE_FALSE(ParseSsdpResponse("garbage"));
}

TEST_CASE("device descriptions are read from XML", "[probes][upnp]")
{
    auto device = ParseDeviceDescription(ROUTER_DESCRIPTION);

    REQUIRE(device);
    CHECK(device->friendly_name == "Home Router");
    CHECK(device->device_type == "Router/Gateway");
    CHECK(device->manufacturer == "Netgear");
    CHECK(device->model == "R7000");
    CHECK(device->services == "UPnP,HTTP");
}

TEST_CASE("device descriptions fill defaults for missing fields", "[probes][upnp]")
{
    auto named = ParseDeviceDescription("<root><device><friendlyName>Speaker</friendlyName></device></root>");
    REQUIRE(named);
    CHECK(named->friendly_name == "Speaker");
    CHECK(named->device_type == "UPnP Device");
    CHECK(named->manufacturer == "Unknown");
    CHECK(named->model == "Unknown");

    auto typed = ParseDeviceDescription(
        "<root><device><deviceType>urn:schemas-upnp-org:device:Printer:1</deviceType></device></root>");
    REQUIRE(typed);
    CHECK(typed->friendly_name == "UPnP Device");
    CHECK(typed->device_type == "Printer");

    REQUIRE_FALSE(ParseDeviceDescription("<root><device><manufacturer>Acme</manufacturer></device></root>"));
    REQUIRE_FALSE(ParseDeviceDescription("<html><body>Not found</body></html>"));
}

TEST_CASE("UPnP device URNs are simplified", "[probes][upnp]")
{
    CHECK(SimplifyDeviceType("urn:schemas-upnp-org:device:InternetGatewayDevice:2") == "Router/Gateway");
    CHECK(SimplifyDeviceType("urn:schemas-upnp-org:device:MediaServer:1") == "Media Server");
    CHECK(SimplifyDeviceType("urn:schemas-upnp-org:device:MediaRenderer:1") == "Media Renderer");
    CHECK(SimplifyDeviceType("urn:schemas-upnp-org:device:Printer:1") == "Printer");
    CHECK(SimplifyDeviceType("urn:dial-multiscreen-org:device:dial:1") == "UPnP Device");
    CHECK(SimplifyDeviceType("") == "UPnP Device");
}

TEST_CASE("the device type is guessed from the SERVER header", "[probes][upnp]")
{
    CHECK(DeviceTypeFromServer("RT-AC68U Router") == "Router/Gateway");
    CHECK(DeviceTypeFromServer("HP Printer/1.0") == "Printer");
    CHECK(DeviceTypeFromServer("DLNADOC/1.50") == "Media Server");
    CHECK(DeviceTypeFromServer("Synology NAS") == "NAS/Storage");
    CHECK(DeviceTypeFromServer("Webcam/2.0") == "IP Camera");
    CHECK(DeviceTypeFromServer("Samsung SmartTV") == "Smart TV");
    CHECK(DeviceTypeFromServer("Custom/1.0") == "UPnP Device");
}

TEST_CASE("the manufacturer is guessed from the SERVER header in order", "[probes][upnp]")
{
    CHECK(ManufacturerFromServer("Linux/3.14 UPnP/1.0 MiniUPnPd/2.1") == "Linux");
    CHECK(ManufacturerFromServer("Microsoft-Windows/10.0 UPnP/1.0") == "Microsoft");
    CHECK(ManufacturerFromServer("MiniUPnPd/2.1") == "Generic UPnP");
    CHECK(ManufacturerFromServer("FRITZ!Box 7590") == "AVM Fritz");
    CHECK(ManufacturerFromServer("TPLINK-Archer") == "TP-Link");
    CHECK(ManufacturerFromServer("Custom/1.0") == "Unknown");
}

TEST_CASE("the model is the first dotted version in the SERVER header", "[probes][upnp]")
{
    CHECK(ModelFromServer("Linux/3.14.28 UPnP/1.0") == "v3.14.28");
    CHECK(ModelFromServer("UPnP/1.0") == "v1.0");
    CHECK(ModelFromServer("Box 7590 build.") == "Unknown");
    CHECK(ModelFromServer("") == "Unknown");
}

TEST_CASE("the friendly name falls back from SERVER to USN", "[probes][upnp]")
{
    CHECK(FriendlyNameFromServer("Linux/3.14 UPnP/1.0", "") == "Linux");
    CHECK(FriendlyNameFromServer("RT-AC68U", "") == "RT-AC68U");
    CHECK(FriendlyNameFromServer("", "uuid:12345678-aaaa-bbbb-cccc-dddddddddddd::upnp:rootdevice") == "12345678");
    CHECK(FriendlyNameFromServer("", "uuid:only-a-uuid") == "UPnP Device");
    CHECK(FriendlyNameFromServer("", "") == "UPnP Device");
}

TEST_CASE("SSDP headers alone describe a device", "[probes][upnp]")
{
    SsdpResponse response;
    response.location = "http://192.168.1.1:1900/gateway.xml";
    response.server = "Linux/2.6.36 UPnP/1.0 gateway";
    response.usn = "uuid:0011aabb::upnp:rootdevice";

    auto device = DeviceFromSsdp(response);

    CHECK(device.friendly_name == "Linux");
    CHECK(device.device_type == "Router/Gateway");
    CHECK(device.manufacturer == "Linux");
    CHECK(device.model == "v2.6.36");
    CHECK(device.services == "UPnP");
    CHECK(device.location == response.location);
    CHECK(device.server == response.server);
}

TEST_CASE("the UPnP probe reports its kind and priority", "[probes][upnp]")
{
    UpnpProbe probe(engine::DefaultConfigFor(engine::ProbeKind::Upnp));

    CHECK(probe.Kind() == engine::ProbeKind::Upnp);
    CHECK(probe.Priority() == 3);
}

TEST_CASE("an unreachable address yields no UPnP device", "[probes][upnp][network]")
{
    auto config = engine::DefaultConfigFor(engine::ProbeKind::Upnp);
    config.timeout = 400ms;
    UpnpProbe probe(config);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(probe.ProbeOne(engine::ScanTarget{"192.0.2.1", "test"}));
    CHECK(std::chrono::steady_clock::now() - start < 3s);
}
