/**
 * @file chunk_sender.hpp
 * @brief Health check and retrying chunk POST against one endpoint
 *
 * WHY THIS FILE EXISTS:
 * The remote indexer fails transiently under load. Every chunk gets a bounded
 * attempt chain with exponential backoff, while client-side rejections fail
 * fast and cancellation ends the chain at once.
 *
 * RETRY RULES:
 * - 2xx                      -> success
 * - 5xx, transport, timeout  -> retry, up to max_retries (4 attempts total)
 * - other status             -> failed, no retry
 * - cancellation             -> cancelled result, not a failure
 * Backoff before retry n is 2^(n-1) * base_delay + jitter in [0, max_jitter).
 *
 * Each attempt borrows a slot from the ConnectionPool when one is supplied,
 * and gives it back before sleeping.
 */

#pragma once

#include "ingest/core/cancellation.hpp"
#include "ingest/core/result.hpp"
#include "ingest/net/connection_pool.hpp"
#include "ingest/net/endpoint.hpp"
#include "ingest/net/http_transport.hpp"
#include "ingest/net/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ingest::delivery {

struct RetryPolicy {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_jitter{500};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds health_timeout{5000};
};

class ChunkSender {
public:
    /**
     * PARAMETERS:
     * pool - Optional; must outlive the sender
     */
    ChunkSender(std::shared_ptr<net::HttpTransport> transport,
                net::Endpoint endpoint,
                std::string api_key,
                RetryPolicy policy = {},
                net::ConnectionPool* pool = nullptr);

    /**
     * @brief GET /health, single attempt
     *
     * ERRORS: FileAborted with an actionable message; Cancelled
     */
    Result<void> health_check(const CancellationToken& token);

    /**
     * @brief POST one serialized payload to /index/chunk with retries
     *
     * Never returns an error value: failures are carried in DeliveryResult.
     */
    net::DeliveryResult send(const std::string& body, const CancellationToken& token);

    const net::Endpoint& endpoint() const noexcept { return endpoint_; }

private:
    Result<net::HttpResponse> attempt(const net::HttpRequest& request,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken& token);
    std::chrono::milliseconds backoff_delay(std::uint32_t retry) const;
    void authorize(net::HttpRequest& request) const;

    std::shared_ptr<net::HttpTransport> transport_;
    net::Endpoint endpoint_;
    std::string api_key_;
    RetryPolicy policy_;
    net::ConnectionPool* pool_;
};

} // namespace ingest::delivery
