#include <catch2/catch.hpp>
#include "SimpleHttpUiServer.hpp"

using namespace scramble;

TEST_CASE("Request paths map to routes", "[http]")
{
    REQUIRE(routeForPath("/") == HttpRoute::Index);
    REQUIRE(routeForPath("/snapshot") == HttpRoute::Snapshot);
    REQUIRE(routeForPath("/snapshot?t=123") == HttpRoute::Snapshot);
    REQUIRE(routeForPath("/command?cmd=start") == HttpRoute::Command);
    REQUIRE(routeForPath("/config/api") == HttpRoute::ConfigApi);
    REQUIRE(routeForPath("/textures") == HttpRoute::Textures);
    REQUIRE(routeForPath("/assets/app.js") == HttpRoute::Unknown);
}

TEST_CASE("Query parameters are extracted by name", "[http]")
{
    REQUIRE(extractQueryParam("/command?cmd=reset", "cmd") == "reset");
    REQUIRE(extractQueryParam("/command?x=1&cmd=step", "cmd") == "step");
    REQUIRE(extractQueryParam("/command?command=step", "cmd").empty());
    REQUIRE(extractQueryParam("/command", "cmd").empty());
}

TEST_CASE("Responses carry length and no-cache headers", "[http]")
{
    std::string response = SimpleHttpUiServer::buildHttpResponse("200 OK", "application/json", "{}");
    REQUIRE(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    REQUIRE(response.find("Content-Length: 2\r\n") != std::string::npos);
    REQUIRE(response.find("Cache-Control: no-store") != std::string::npos);
    REQUIRE(response.substr(response.size() - 6) == "\r\n\r\n{}");
}
