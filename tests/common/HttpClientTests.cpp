#include "common/HttpClient.hpp"
#include "support/LoopbackServer.hpp"

#include <catch2/catch.hpp>

using namespace net_scan::common;

TEST_CASE("http urls are split into host, port and path", "[common][http]")
{
    auto plain = ParseHttpUrl("http://192.168.1.1:49152/rootDesc.xml");
    REQUIRE(plain);
    REQUIRE(plain->host == "192.168.1.1");
    REQUIRE(plain->port == 49152);
    REQUIRE(plain->path == "/rootDesc.xml");
    REQUIRE_FALSE(plain->tls);

    auto secure = ParseHttpUrl("https://nas.lan");
    REQUIRE(secure);
    REQUIRE(secure->port == 443);
    REQUIRE(secure->path == "/");
    REQUIRE(secure->tls);

    auto v6 = ParseHttpUrl("http://[fe80::1]:8080/desc.xml");
    REQUIRE(v6);
    REQUIRE(v6->host == "fe80::1");
    REQUIRE(v6->port == 8080);

    REQUIRE_FALSE(ParseHttpUrl("ftp://host/"));
    REQUIRE_FALSE(ParseHttpUrl("http://:80/"));
    REQUIRE_FALSE(ParseHttpUrl("http://host:70000/"));
}

TEST_CASE("responses keep lowercased headers and the body", "[common][http]")
{
    auto resp = ParseHttpResponse("HTTP/1.1 200 OK\r\n"
                                  "Server: lighttpd/1.4.59\r\n"
                                  "CACHE-CONTROL: max-age=1800\r\n"
                                  "\r\n"
                                  "<root/>");
    REQUIRE(resp);
    REQUIRE(resp->status_code == 200);
    REQUIRE(resp->headers.at("server") == "lighttpd/1.4.59");
    REQUIRE(resp->Header("Cache-Control") == "max-age=1800");
    REQUIRE(resp->Header("Location", "none") == "none");
    REQUIRE(resp->body == "<root/>");
}

TEST_CASE("SSDP notifications parse without a status code", "[common][http]")
{
    auto resp = ParseHttpResponse("NOTIFY * HTTP/1.1\r\nLOCATION: http://10.0.0.1/desc.xml\r\n\r\n");
    REQUIRE(resp);
    REQUIRE(resp->status_code == 0);
    REQUIRE(resp->Header("location") == "http://10.0.0.1/desc.xml");

    REQUIRE_FALSE(ParseHttpResponse("garbage"));
}

TEST_CASE("GET against a loopback listener", "[common][http][network]")
{
    net_scan::testing::LoopbackServer server("HTTP/1.0 404 Not Found\r\nServer: test/1.0\r\n\r\nmissing", true);

    auto resp = HttpGet("127.0.0.1", server.Port(), "/nothing", false, std::chrono::milliseconds(2000));
    REQUIRE(resp);
    REQUIRE(resp->status_code == 404);
    REQUIRE(resp->Header("server") == "test/1.0");
    REQUIRE(resp->body == "missing");
}

TEST_CASE("GET body is capped", "[common][http][network]")
{
    net_scan::testing::LoopbackServer server("HTTP/1.0 200 OK\r\n\r\n0123456789", true);

    auto resp = HttpGet("127.0.0.1", server.Port(), "/", false, std::chrono::milliseconds(2000), 4);
    REQUIRE(resp);
    REQUIRE(resp->body == "0123");
}
