/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe hub for pipeline notifications
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator reports what happens to files and chunks without knowing
 * who listens. Logging, metrics and the command-line driver subscribe to the
 * events they care about.
 *
 * WHAT IT DOES:
 * - Keeps one listener list per event type, keyed by std::type_index
 * - Delivers on the emitting thread, in subscription order
 * - Contains listener exceptions so one bad listener cannot break a file run
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<ChunkDeliveredEvent>([](const ChunkDeliveredEvent& e) { ... });
 * bus.emit(ChunkDeliveredEvent{...});
 * bus.unsubscribe<ChunkDeliveredEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace ingest::events {

/**
 * @brief Typed event bus
 *
 * THREAD SAFETY:
 * File workers emit concurrently. Listeners are snapshotted under a shared
 * lock and invoked after it is released, so a listener may subscribe, emit or
 * unsubscribe without deadlocking. A listener removed mid-emit may still see
 * the event in flight.
 */
class EventBus {
public:
    using ListenerId = size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a listener for one event type
     *
     * RETURNS: Id to pass to unsubscribe()
     */
    template<typename EventType>
    ListenerId subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<const Thunk>(
            [fn = std::move(handler)](const void* event) {
                fn(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const ListenerId id = ++last_id_;
        listeners_[key<EventType>()].push_back(Listener{id, std::move(erased)});
        return id;
    }

    template<typename EventType>
    void unsubscribe(ListenerId id) {
        std::unique_lock lock(mutex_);
        auto found = listeners_.find(key<EventType>());
        if (found == listeners_.end()) {
            return;
        }
        auto& list = found->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Listener& l) { return l.id == id; }),
                   list.end());
        if (list.empty()) {
            listeners_.erase(found);
        }
    }

    /**
     * @brief Deliver an event to every current listener of its type
     *
     * A listener that throws is logged at error level; the rest still run.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        for (const auto& thunk : snapshot(key<EventType>())) {
            try {
                (*thunk)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] listener for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = listeners_.find(key<EventType>());
        return found == listeners_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        listeners_.clear();
    }

private:
    using Thunk = std::function<void(const void*)>;

    struct Listener {
        ListenerId id;
        std::shared_ptr<const Thunk> call;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<const Thunk>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const Thunk>> out;
        std::shared_lock lock(mutex_);
        auto found = listeners_.find(type);
        if (found != listeners_.end()) {
            out.reserve(found->second.size());
            for (const auto& listener : found->second) {
                out.push_back(listener.call);
            }
        }
        return out;
    }

    std::unordered_map<std::type_index, std::vector<Listener>> listeners_;
    mutable std::shared_mutex mutex_;
    ListenerId last_id_ = 0;
};

} // namespace ingest::events
