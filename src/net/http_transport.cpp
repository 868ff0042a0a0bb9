#include "ingest/net/http_transport.hpp"

#include "ingest/net/http_response_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <functional>
#include <optional>

namespace ingest::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);

} // namespace

AsioHttpTransport::AsioHttpTransport(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request,
                                             std::chrono::milliseconds timeout,
                                             const CancellationToken& token) {
    if (token.is_cancelled()) {
        return Err<HttpResponse>(ErrorCode::Cancelled, "Operation cancelled");
    }

    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);
    asio::steady_timer deadline(io);

    HttpRequest outbound = request;
    outbound.set_header("Connection", "close");
    const std::string wire = outbound.serialize(endpoint_.host_header());

    HttpResponseParser parser;
    std::array<char, 8192> buffer{};
    bool complete = false;
    bool timed_out = false;
    bool cancelled = false;
    std::optional<std::string> failure;

    auto abort_io = [&]() {
        boost::system::error_code ignored;
        resolver.cancel();
        socket.close(ignored);
        deadline.cancel();
    };

    auto fail = [&](const std::string& what) {
        if (!failure) {
            failure = what;
        }
        abort_io();
    };

    deadline.expires_after(timeout);
    deadline.async_wait([&](boost::system::error_code ec) {
        if (!ec) {
            timed_out = true;
            abort_io();
        }
    });

    std::function<void()> do_read = [&]() {
        socket.async_read_some(asio::buffer(buffer),
            [&](boost::system::error_code ec, std::size_t bytes_transferred) {
                if (ec == asio::error::eof) {
                    if (parser.finish()) {
                        complete = true;
                        abort_io();
                    } else {
                        fail("Connection closed before the response completed");
                    }
                    return;
                }
                if (ec) {
                    fail("Read error: " + ec.message());
                    return;
                }

                auto parsed = parser.parse(buffer.data(), bytes_transferred);
                if (parsed.is_error()) {
                    fail("Malformed response: " + parsed.error().message);
                    return;
                }
                if (parsed.value()) {
                    complete = true;
                    abort_io();
                    return;
                }
                do_read();
            });
    };

    resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
        [&](boost::system::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                fail("Cannot resolve " + endpoint_.host + ": " + ec.message());
                return;
            }
            asio::async_connect(socket, results,
                [&](boost::system::error_code connect_ec, const tcp::endpoint&) {
                    if (connect_ec) {
                        fail("Connect failed: " + connect_ec.message());
                        return;
                    }
                    asio::async_write(socket, asio::buffer(wire),
                        [&](boost::system::error_code write_ec, std::size_t) {
                            if (write_ec) {
                                fail("Write failed: " + write_ec.message());
                                return;
                            }
                            do_read();
                        });
                });
        });

    while (!io.stopped()) {
        io.run_for(kPollSlice);
        if (!cancelled && token.is_cancelled()) {
            cancelled = true;
            abort_io();
        }
    }

    if (complete) {
        return Ok(parser.get_response());
    }
    if (cancelled) {
        return Err<HttpResponse>(ErrorCode::Cancelled, "Operation cancelled");
    }
    if (timed_out) {
        return Err<HttpResponse>(ErrorCode::Transient,
                                 "Request timed out after " + std::to_string(timeout.count()) + "ms");
    }

    const std::string message = failure.value_or("Request did not complete");
    spdlog::debug("[Transport] {} {} failed: {}",
                  HttpRequest::method_to_string(request.method), request.url, message);
    return Err<HttpResponse>(ErrorCode::Transient, message);
}

} // namespace ingest::net
