#include "ingest/store/debounced_writer.hpp"

#include <spdlog/spdlog.h>

namespace ingest::store {

DebouncedWriter::DebouncedWriter(std::string name, std::chrono::milliseconds delay, FlushFn flush)
    : name_(std::move(name)), delay_(delay), flush_(std::move(flush)) {
    thread_ = std::thread([this]() { run(); });
}

DebouncedWriter::~DebouncedWriter() {
    stop();
}

void DebouncedWriter::mark_dirty() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        dirty_ = true;
        deadline_ = std::chrono::steady_clock::now() + delay_;
    }
    cv_.notify_one();
}

bool DebouncedWriter::is_dirty() const {
    std::lock_guard lock(mutex_);
    return dirty_;
}

void DebouncedWriter::flush_now() {
    {
        std::lock_guard lock(mutex_);
        if (!dirty_) {
            return;
        }
        dirty_ = false;
    }
    do_flush();
}

void DebouncedWriter::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }

    bool pending = false;
    {
        std::lock_guard lock(mutex_);
        pending = dirty_;
        dirty_ = false;
    }
    if (pending) {
        do_flush();
    }
}

void DebouncedWriter::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return dirty_ || stopping_; });
        if (stopping_) {
            return;
        }

        // Wait out the quiet period; every mark_dirty() moves the deadline
        while (dirty_ && !stopping_ && std::chrono::steady_clock::now() < deadline_) {
            cv_.wait_until(lock, deadline_);
        }
        if (stopping_) {
            return;
        }
        if (!dirty_) {
            continue;
        }

        dirty_ = false;
        lock.unlock();
        do_flush();
        lock.lock();
    }
}

void DebouncedWriter::do_flush() {
    std::lock_guard guard(flush_mutex_);
    try {
        flush_();
        flush_count_.fetch_add(1);
    } catch (const std::exception& e) {
        spdlog::error("[{}] flush failed: {}", name_, e.what());
    }
}

} // namespace ingest::store
