#pragma once

#include "ingest/core/cancellation.hpp"
#include "ingest/core/result.hpp"
#include "ingest/net/endpoint.hpp"
#include "ingest/net/http_types.hpp"

#include <chrono>

namespace ingest::net {

/**
 * @brief One request/response exchange with the indexing service
 *
 * Implementations honour a per-attempt timeout and abort promptly when the
 * token fires. Errors:
 * - ErrorCode::Cancelled  token fired before or during the exchange
 * - ErrorCode::Transient  resolve / connect / I/O failure, timeout, bad response
 * A response with any status code is Ok; callers interpret the status.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken& token) = 0;
};

/**
 * @brief Plain HTTP/1.1 over Boost.Asio, one connection per exchange
 *
 * Each call runs a private io_context in short slices so the cancellation
 * token is polled while connecting, writing and reading.
 */
class AsioHttpTransport : public HttpTransport {
public:
    explicit AsioHttpTransport(Endpoint endpoint);

    Result<HttpResponse> send(const HttpRequest& request,
                              std::chrono::milliseconds timeout,
                              const CancellationToken& token) override;

    const Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Endpoint endpoint_;
};

} // namespace ingest::net
