#include "ingest/net/endpoint.hpp"
#include "ingest/net/http_types.hpp"

#include <gtest/gtest.h>

using ingest::net::HttpMethod;
using ingest::net::HttpRequest;
using ingest::net::parse_endpoint;

TEST(Endpoint, ParsesHostPortAndBasePath) {
    auto endpoint = parse_endpoint("http://indexer.local:8000/api/v1/");

    ASSERT_TRUE(endpoint.is_ok()) << endpoint.error().message;
    EXPECT_EQ(endpoint.value().host, "indexer.local");
    EXPECT_EQ(endpoint.value().port, 8000);
    EXPECT_EQ(endpoint.value().base_path, "/api/v1");
    EXPECT_EQ(endpoint.value().target("/index/chunk"), "/api/v1/index/chunk");
    EXPECT_EQ(endpoint.value().host_header(), "indexer.local:8000");
    EXPECT_EQ(endpoint.value().to_string(), "http://indexer.local:8000/api/v1");
}

TEST(Endpoint, DefaultsToPort80AndRootPath) {
    auto endpoint = parse_endpoint("http://localhost");

    ASSERT_TRUE(endpoint.is_ok());
    EXPECT_EQ(endpoint.value().port, 80);
    EXPECT_EQ(endpoint.value().host_header(), "localhost");
    EXPECT_EQ(endpoint.value().target("/health"), "/health");
    EXPECT_EQ(endpoint.value().target("health"), "/health");
}

TEST(Endpoint, RejectsBadUrls) {
    EXPECT_TRUE(parse_endpoint("https://secure:443").is_error());
    EXPECT_TRUE(parse_endpoint("localhost:8000").is_error());
    EXPECT_TRUE(parse_endpoint("http://:8000").is_error());
    EXPECT_TRUE(parse_endpoint("http://host:").is_error());
    EXPECT_TRUE(parse_endpoint("http://host:99999").is_error());
    EXPECT_TRUE(parse_endpoint("http://host:80a").is_error());
}

TEST(HttpRequest, SerializesWithHostAndContentLength) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/index/chunk";
    request.set_header("Content-Type", "application/json");
    request.body = "{}";

    const std::string wire = request.serialize("localhost:8000");

    EXPECT_EQ(wire.rfind("POST /index/chunk HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("Host: localhost:8000\r\n"), std::string::npos);
    EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 6), "\r\n\r\n{}");
    EXPECT_EQ(request.get_header("content-type"), "application/json");
}
