#include "ingest/delivery/chunk_sender.hpp"

#include "ingest/delivery/payload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace ingest::delivery {

namespace {

using Clock = std::chrono::steady_clock;

std::int64_t elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

std::string status_error(const net::HttpResponse& response) {
    std::string text = response.body_as_string();
    if (text.empty()) {
        text = response.reason_phrase;
    }
    return "Server error " + std::to_string(response.status_code) + ": " + text;
}

net::DeliveryResult cancelled_result(std::uint32_t retries, Clock::time_point started) {
    net::DeliveryResult result;
    result.cancelled = true;
    result.error = "Operation cancelled";
    result.retry_count = retries;
    result.processing_time_ms = elapsed_ms(started);
    return result;
}

} // namespace

ChunkSender::ChunkSender(std::shared_ptr<net::HttpTransport> transport,
                         net::Endpoint endpoint,
                         std::string api_key,
                         RetryPolicy policy,
                         net::ConnectionPool* pool)
    : transport_(std::move(transport)),
      endpoint_(std::move(endpoint)),
      api_key_(std::move(api_key)),
      policy_(policy),
      pool_(pool) {}

void ChunkSender::authorize(net::HttpRequest& request) const {
    if (!api_key_.empty()) {
        request.set_header("Authorization", "Bearer " + api_key_);
    }
}

Result<net::HttpResponse> ChunkSender::attempt(const net::HttpRequest& request,
                                               std::chrono::milliseconds timeout,
                                               const CancellationToken& token) {
    if (pool_ == nullptr) {
        return transport_->send(request, timeout, token);
    }

    auto lease = pool_->acquire(token);
    if (lease.is_error()) {
        return Err<net::HttpResponse>(lease.error());
    }
    const auto started = Clock::now();
    auto response = transport_->send(request, timeout, token);
    lease.value().record_response_time(std::chrono::milliseconds(elapsed_ms(started)));
    return response;
}

Result<void> ChunkSender::health_check(const CancellationToken& token) {
    net::HttpRequest request;
    request.method = net::HttpMethod::GET;
    request.url = endpoint_.target("/health");
    authorize(request);

    auto response = attempt(request, policy_.health_timeout, token);
    std::string reason;
    if (response.is_error()) {
        if (response.error().is_cancelled()) {
            return Err<void>(response.error());
        }
        reason = response.error().message;
    } else if (!response.value().is_success()) {
        reason = "Server health check failed: " + std::to_string(response.value().status_code)
                 + " " + response.value().reason_phrase;
    } else {
        spdlog::debug("[Health] {} ok", endpoint_.to_string());
        return Ok();
    }

    spdlog::error("[Health] {} failed: {}", endpoint_.to_string(), reason);
    return Err<void>(Error{ErrorCode::FileAborted,
                           "Cannot connect to server at " + endpoint_.to_string() + ". Error: " + reason
                           + ". Please check configuration and server status."});
}

std::chrono::milliseconds ChunkSender::backoff_delay(std::uint32_t retry) const {
    thread_local std::mt19937 rng{std::random_device{}()};
    const auto jitter_bound = std::max<std::int64_t>(policy_.max_jitter.count(), 1);
    std::uniform_int_distribution<std::int64_t> jitter(0, jitter_bound - 1);

    const auto exponential = policy_.base_delay * (1LL << (retry - 1));
    return exponential + std::chrono::milliseconds(policy_.max_jitter.count() > 0 ? jitter(rng) : 0);
}

net::DeliveryResult ChunkSender::send(const std::string& body, const CancellationToken& token) {
    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = endpoint_.target("/index/chunk");
    request.body = body;
    request.set_header("Content-Type", "application/json");
    authorize(request);

    const auto started = Clock::now();
    std::uint32_t retries = 0;
    std::string last_error;

    while (true) {
        if (token.is_cancelled()) {
            return cancelled_result(retries, started);
        }

        auto response = attempt(request, policy_.request_timeout, token);
        if (response.is_error()) {
            if (response.error().is_cancelled()) {
                return cancelled_result(retries, started);
            }
            if (response.error().code == ErrorCode::Shutdown) {
                net::DeliveryResult result;
                result.error = response.error().message;
                result.retry_count = retries;
                result.processing_time_ms = elapsed_ms(started);
                return result;
            }
            last_error = response.error().message;
        } else if (response.value().is_success()) {
            net::DeliveryResult result;
            result.success = true;
            result.external_id = external_id_from_response(response.value().body_as_string());
            result.retry_count = retries;
            result.processing_time_ms = elapsed_ms(started);
            return result;
        } else if (response.value().is_server_error()) {
            last_error = status_error(response.value());
        } else {
            net::DeliveryResult result;
            result.error = status_error(response.value());
            result.retry_count = retries;
            result.processing_time_ms = elapsed_ms(started);
            return result;
        }

        if (retries >= policy_.max_retries) {
            net::DeliveryResult result;
            result.error = "Failed after " + std::to_string(policy_.max_retries) + " retries: " + last_error;
            result.retry_count = retries;
            result.processing_time_ms = elapsed_ms(started);
            return result;
        }

        ++retries;
        const auto delay = backoff_delay(retries);
        spdlog::debug("[Retry] {} attempt={} delay={}ms error={}",
                      request.url, retries + 1, delay.count(), last_error);
        if (token.wait_for(delay)) {
            return cancelled_result(retries, started);
        }
    }
}

} // namespace ingest::delivery
