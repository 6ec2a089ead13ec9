#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace anvil::core {

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================

class ScopedConnection {
public:
    ScopedConnection() = default;

    explicit ScopedConnection(std::function<void()> disconnect_fn)
        : m_disconnect(std::move(disconnect_fn)) {}

    ~ScopedConnection() {
        disconnect();
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : m_disconnect(std::move(other.m_disconnect)) {
        other.m_disconnect = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&& other) noexcept {
        if (this != &other) {
            disconnect();
            m_disconnect = std::move(other.m_disconnect);
            other.m_disconnect = nullptr;
        }
        return *this;
    }

    void disconnect() {
        if (m_disconnect) {
            m_disconnect();
            m_disconnect = nullptr;
        }
    }

    bool connected() const {
        return m_disconnect != nullptr;
    }

    // Keep the handler registered for the dispatcher's lifetime
    void release() {
        m_disconnect = nullptr;
    }

private:
    std::function<void()> m_disconnect;
};

// ============================================================================
// EventDispatcher - Type-keyed observer lists
// ============================================================================
//
// Every event type has its own list of handlers. Handlers run synchronously in
// subscription order. The dispatcher must outlive every ScopedConnection it
// hands out.

class EventDispatcher {
public:
    EventDispatcher() = default;
    ~EventDispatcher() = default;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    // ========================================================================
    // Subscription
    // ========================================================================

    template<typename T>
    ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto type_idx = std::type_index(typeid(T));
        uint64_t handler_id = m_next_handler_id++;

        auto wrapper = [callback = std::move(callback)](const void* event) {
            callback(*static_cast<const T*>(event));
        };

        {
            std::lock_guard<std::mutex> lock(m_handlers_mutex);
            m_handlers[type_idx].push_back({handler_id, std::move(wrapper)});
        }

        return ScopedConnection([this, type_idx, handler_id]() {
            remove_handler(type_idx, handler_id);
        });
    }

    // ========================================================================
    // Immediate Dispatch
    // ========================================================================

    // Handlers are copied before invocation, so a handler may subscribe or
    // disconnect without invalidating the iteration.
    template<typename T>
    void dispatch(const T& event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto type_idx = std::type_index(typeid(T));
        std::vector<Handler> handlers_copy;

        {
            std::lock_guard<std::mutex> lock(m_handlers_mutex);
            auto it = m_handlers.find(type_idx);
            if (it != m_handlers.end()) {
                handlers_copy = it->second;
            }
        }

        for (const auto& handler : handlers_copy) {
            handler.callback(&event);
        }
    }

    // ========================================================================
    // Deferred Dispatch
    // ========================================================================

    // Queued events are delivered by flush(), typically once per frame
    template<typename T>
    void queue(T event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queued_events.push_back([this, event = std::move(event)]() {
            dispatch(event);
        });
    }

    void flush();

    bool has_queued_events() const {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        return !m_queued_events.empty();
    }

    size_t queued_event_count() const {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        return m_queued_events.size();
    }

    void clear_queue() {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queued_events.clear();
    }

    // ========================================================================
    // Utility
    // ========================================================================

    template<typename T>
    void clear_handlers() {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        m_handlers.erase(std::type_index(typeid(T)));
    }

    void clear_all_handlers() {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        m_handlers.clear();
    }

    template<typename T>
    size_t handler_count() const {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        auto it = m_handlers.find(std::type_index(typeid(T)));
        return it != m_handlers.end() ? it->second.size() : 0;
    }

private:
    struct Handler {
        uint64_t id;
        std::function<void(const void*)> callback;
    };

    void remove_handler(std::type_index type_idx, uint64_t handler_id);

    mutable std::mutex m_handlers_mutex;
    std::unordered_map<std::type_index, std::vector<Handler>> m_handlers;

    mutable std::mutex m_queue_mutex;
    std::vector<std::function<void()>> m_queued_events;

    std::atomic<uint64_t> m_next_handler_id{1};
};

} // namespace anvil::core
