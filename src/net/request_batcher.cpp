#include "ingest/net/request_batcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ingest::net {

RequestBatcher::RequestBatcher(BatcherOptions options, Dispatcher dispatcher)
    : options_(options), dispatcher_(std::move(dispatcher)) {
    options_.max_batch_size = std::max<std::size_t>(options_.max_batch_size, 1);
    thread_ = std::thread([this]() { run(); });
}

RequestBatcher::~RequestBatcher() {
    shutdown();
}

RequestBatcher::ResultFuture RequestBatcher::add_request(BatchRequest request) {
    Pending pending{std::move(request), {}};
    auto future = pending.promise.get_future();
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            pending.promise.set_value(Err<std::vector<DeliveryResult>>(ErrorCode::Shutdown,
                                                                       "Request batcher shut down"));
            return future;
        }
        if (queue_.empty()) {
            window_start_ = std::chrono::steady_clock::now();
        }
        queue_.push_back(std::move(pending));
    }
    cv_.notify_one();
    return future;
}

std::size_t RequestBatcher::queue_size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::uint64_t RequestBatcher::flush_count() const {
    std::lock_guard lock(mutex_);
    return flush_count_;
}

void RequestBatcher::flush() {
    while (flush_cycle()) {
    }
}

void RequestBatcher::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (stopping_) {
            return;
        }

        // Coalescing window, cut short when the batch fills up
        const auto deadline = window_start_ + options_.coalescing_window;
        cv_.wait_until(lock, deadline, [this]() {
            return stopping_ || queue_.size() >= options_.max_batch_size;
        });
        if (stopping_) {
            return;
        }

        lock.unlock();
        flush_cycle();
        lock.lock();
    }
}

bool RequestBatcher::flush_cycle() {
    std::lock_guard flush_guard(flush_mutex_);

    std::vector<Pending> batch;
    {
        std::lock_guard lock(mutex_);
        const std::size_t take = std::min(queue_.size(), options_.max_batch_size);
        if (take == 0) {
            return false;
        }
        batch.reserve(take);
        for (std::size_t i = 0; i < take; ++i) {
            batch.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        // Leftovers start a fresh window
        window_start_ = std::chrono::steady_clock::now();
        ++flush_count_;
    }

    std::vector<std::vector<Pending*>> groups;
    for (auto& pending : batch) {
        auto it = std::find_if(groups.begin(), groups.end(), [&](const auto& group) {
            const auto& first = group.front()->request;
            return first.file_path == pending.request.file_path && first.owner == pending.request.owner;
        });
        if (it == groups.end()) {
            groups.push_back({&pending});
        } else {
            it->push_back(&pending);
        }
    }

    spdlog::debug("[Batcher] flushing {} requests in {} groups", batch.size(), groups.size());
    for (auto& members : groups) {
        dispatch_group(members);
    }
    return true;
}

void RequestBatcher::dispatch_group(std::vector<Pending*>& members) {
    const std::string file_path = members.front()->request.file_path;
    const std::string owner = members.front()->request.owner;
    std::stable_sort(members.begin(), members.end(), [](const Pending* lhs, const Pending* rhs) {
        return lhs->request.priority > rhs->request.priority;
    });

    ChunkRefs chunks;
    for (const auto* member : members) {
        for (const auto& chunk : member->request.chunks) {
            chunks.push_back(&chunk);
        }
    }

    auto fail_all = [&](const Error& error) {
        for (auto* member : members) {
            member->promise.set_value(Err<std::vector<DeliveryResult>>(error));
        }
    };

    Result<std::vector<DeliveryResult>> outcome = Err<std::vector<DeliveryResult>>(
        ErrorCode::Transient, "Dispatcher produced no result");
    try {
        outcome = dispatcher_(file_path, owner, chunks);
    } catch (const std::exception& e) {
        spdlog::error("[Batcher] group {} dispatch threw: {}", file_path, e.what());
        fail_all(Error{ErrorCode::Transient, std::string("Batch dispatch failed: ") + e.what()});
        return;
    }

    if (outcome.is_error()) {
        spdlog::warn("[Batcher] group {} failed: {}", file_path, outcome.error().message);
        fail_all(outcome.error());
        return;
    }

    auto& results = outcome.value();
    if (results.size() != chunks.size()) {
        fail_all(Error{ErrorCode::Transient,
                       "Dispatcher returned " + std::to_string(results.size()) +
                       " results for " + std::to_string(chunks.size()) + " chunks"});
        return;
    }

    std::size_t offset = 0;
    for (auto* member : members) {
        const std::size_t count = member->request.chunks.size();
        std::vector<DeliveryResult> own(std::make_move_iterator(results.begin() + static_cast<std::ptrdiff_t>(offset)),
                                        std::make_move_iterator(results.begin() + static_cast<std::ptrdiff_t>(offset + count)));
        offset += count;
        member->promise.set_value(Ok(std::move(own)));
    }
}

void RequestBatcher::shutdown() {
    std::deque<Pending> abandoned;
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    {
        std::lock_guard lock(mutex_);
        abandoned.swap(queue_);
    }
    for (auto& pending : abandoned) {
        pending.promise.set_value(Err<std::vector<DeliveryResult>>(ErrorCode::Shutdown,
                                                                   "Request batcher shut down"));
    }
    if (!abandoned.empty()) {
        spdlog::warn("[Batcher] shut down with {} pending requests", abandoned.size());
    }
}

} // namespace ingest::net
