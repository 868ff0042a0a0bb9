#include "ingest/net/http_transport.hpp"

#include "support/stub_server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using ingest::CancellationToken;
using ingest::ErrorCode;
using ingest::net::AsioHttpTransport;
using ingest::net::Endpoint;
using ingest::net::HttpMethod;
using ingest::net::HttpRequest;
using ingest::testing::StubReply;
using ingest::testing::StubRequest;
using ingest::testing::StubServer;

namespace {

HttpRequest post(const std::string& target, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = target;
    request.set_header("Content-Type", "application/json");
    request.body = body;
    return request;
}

Endpoint local(std::uint16_t port, const std::string& base = "") {
    return Endpoint{"127.0.0.1", port, base};
}

} // namespace

TEST(AsioHttpTransport, PostsAndReadsContentLengthResponse) {
    StubServer server([](const StubRequest&) { return StubReply{200, R"({"chunk_id": "abc"})"}; });
    const auto endpoint = local(server.port(), "/api");
    AsioHttpTransport transport(endpoint);
    CancellationToken token;

    auto response = transport.send(post(endpoint.target("/index/chunk"), R"({"content":"x"})"),
                                   std::chrono::seconds(5), token);

    ASSERT_TRUE(response.is_ok()) << response.error().message;
    EXPECT_EQ(response.value().status_code, 200);
    EXPECT_EQ(response.value().body_as_string(), R"({"chunk_id": "abc"})");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].target, "/api/index/chunk");
    EXPECT_EQ(requests[0].body, R"({"content":"x"})");
    EXPECT_EQ(requests[0].headers["connection"], "close");
    EXPECT_EQ(requests[0].headers["host"], "127.0.0.1:" + std::to_string(server.port()));
}

TEST(AsioHttpTransport, ReadsChunkedResponse) {
    StubServer server([](const StubRequest&) {
        StubReply reply{200, R"({"job_id": "job-7", "status": "queued"})"};
        reply.chunked = true;
        return reply;
    });
    AsioHttpTransport transport(local(server.port()));
    CancellationToken token;

    auto response = transport.send(post("/index/chunk", "{}"), std::chrono::seconds(5), token);

    ASSERT_TRUE(response.is_ok()) << response.error().message;
    EXPECT_EQ(response.value().body_as_string(), R"({"job_id": "job-7", "status": "queued"})");
}

TEST(AsioHttpTransport, ErrorStatusIsStillAResponse) {
    StubServer server([](const StubRequest&) { return StubReply{503, "overloaded"}; });
    AsioHttpTransport transport(local(server.port()));
    CancellationToken token;

    HttpRequest health;
    health.url = "/health";
    auto response = transport.send(health, std::chrono::seconds(5), token);

    ASSERT_TRUE(response.is_ok());
    EXPECT_EQ(response.value().status_code, 503);
    EXPECT_TRUE(response.value().is_server_error());
    EXPECT_EQ(server.requests().at(0).method, "GET");
}

TEST(AsioHttpTransport, TimesOut) {
    StubServer server([](const StubRequest&) {
        StubReply reply{200, "late"};
        reply.delay = std::chrono::milliseconds(1000);
        return reply;
    });
    AsioHttpTransport transport(local(server.port()));
    CancellationToken token;

    auto response = transport.send(post("/index/chunk", "{}"), std::chrono::milliseconds(50), token);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Transient);
    EXPECT_NE(response.error().message.find("timed out"), std::string::npos);
}

TEST(AsioHttpTransport, CancellationAbortsInFlightRequest) {
    StubServer server([](const StubRequest&) {
        StubReply reply{200, "late"};
        reply.delay = std::chrono::milliseconds(3000);
        return reply;
    });
    AsioHttpTransport transport(local(server.port()));
    CancellationToken token;

    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel("user stop");
    });

    const auto start = std::chrono::steady_clock::now();
    auto response = transport.send(post("/index/chunk", "{}"), std::chrono::seconds(10), token);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST(AsioHttpTransport, AlreadyCancelledTokenSendsNothing) {
    StubServer server([](const StubRequest&) { return StubReply{200, "{}"}; });
    AsioHttpTransport transport(local(server.port()));
    CancellationToken token;
    token.cancel("done");

    auto response = transport.send(post("/index/chunk", "{}"), std::chrono::seconds(1), token);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Cancelled);
    EXPECT_TRUE(server.requests().empty());
}

TEST(AsioHttpTransport, ConnectionRefusedIsTransient) {
    std::uint16_t port = 0;
    {
        // Grab a free port, then release it so nothing listens there
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
        port = acceptor.local_endpoint().port();
    }
    AsioHttpTransport transport(local(port));
    CancellationToken token;

    auto response = transport.send(post("/index/chunk", "{}"), std::chrono::seconds(2), token);

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Transient);
}
