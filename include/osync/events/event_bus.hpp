/**
 * @file event_bus.hpp
 * @brief Type-indexed event bus between the engine and its observers
 *
 * WHY THIS FILE EXISTS:
 * SyncEngine reports state changes, progress, failed records and conflicts
 * as events. Applications, the LoggerComponent and the MetricsComponent
 * subscribe without the engine knowing about any of them.
 *
 * WHAT IT DOES:
 * - Handlers are keyed by the event's static type
 * - emit() runs handlers synchronously on the emitting thread (for the
 *   engine that is its sync worker)
 * - A throwing handler is logged and counted; the other handlers and the
 *   emitter carry on
 * - subscribe_scoped() returns a Subscription that unsubscribes when it is
 *   destroyed, so observers that capture `this` cannot outlive their
 *   registration
 *
 * EXAMPLE:
 * EventBus bus;
 * auto sub = bus.subscribe_scoped<SyncStateChangedEvent>([](const SyncStateChangedEvent& e) { ... });
 * bus.emit(SyncStateChangedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace osync::events {

class EventBus;

/**
 * @brief Owns one handler registration
 *
 * Move-only. The bus must outlive every Subscription taken from it.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, std::type_index type, std::size_t id) : bus_(bus), type_(type), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : bus_(other.bus_), type_(other.type_), id_(other.id_) {
        other.bus_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            type_ = other.type_;
            id_ = other.id_;
            other.bus_ = nullptr;
        }
        return *this;
    }

    /// Unsubscribe now. Safe to call from inside a handler.
    void reset() noexcept;

    [[nodiscard]] bool active() const noexcept { return bus_ != nullptr; }
    [[nodiscard]] std::size_t id() const noexcept { return id_; }

private:
    EventBus* bus_ = nullptr;
    std::type_index type_{typeid(void)};
    std::size_t id_ = 0;
};

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS:
     * Handler id for unsubscribe<EventType>(id)
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<ErasedHandler>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const std::size_t id = next_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(Entry{id, std::move(erased)});
        return id;
    }

    /// Like subscribe(), but the registration ends with the returned handle.
    template<typename EventType>
    [[nodiscard]] Subscription subscribe_scoped(std::function<void(const EventType&)> handler) {
        const auto id = subscribe<EventType>(std::move(handler));
        return Subscription(this, std::type_index(typeid(EventType)), id);
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        remove(std::type_index(typeid(EventType)), handler_id);
    }

    /**
     * @brief Deliver `event` to every handler registered for EventType
     *
     * Handlers registered or removed while emit() runs take effect from the
     * next emit().
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<ErasedHandler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            const auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.handler);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                failures_.fetch_add(1);
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            } catch (...) {
                failures_.fetch_add(1);
                spdlog::error("[EventBus] handler for {} threw a non-standard exception", typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        const auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /// Handler invocations that ended in an exception.
    [[nodiscard]] std::size_t handler_failures() const noexcept { return failures_.load(); }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    friend class Subscription;

    using ErasedHandler = std::function<void(const void*)>;

    struct Entry {
        std::size_t id;
        std::shared_ptr<ErasedHandler> handler;
    };

    void remove(std::type_index type, std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        const auto it = handlers_.find(type);
        if (it == handlers_.end()) {
            return;
        }
        auto& entries = it->second;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [handler_id](const Entry& e) { return e.id == handler_id; }),
                      entries.end());
        if (entries.empty()) {
            handlers_.erase(it);
        }
    }

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_id_ = 1;
    std::atomic<std::size_t> failures_{0};
};

inline void Subscription::reset() noexcept {
    if (bus_ != nullptr) {
        bus_->remove(type_, id_);
        bus_ = nullptr;
    }
}

} // namespace osync::events
