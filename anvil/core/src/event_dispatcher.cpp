#include <anvil/core/event_dispatcher.hpp>

namespace anvil::core {

void EventDispatcher::flush() {
    // Swap out so handlers can queue follow-up events for the next flush
    std::vector<std::function<void()>> events_to_dispatch;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        events_to_dispatch.swap(m_queued_events);
    }

    for (const auto& dispatch_fn : events_to_dispatch) {
        dispatch_fn();
    }
}

void EventDispatcher::remove_handler(std::type_index type_idx, uint64_t handler_id) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    auto it = m_handlers.find(type_idx);
    if (it == m_handlers.end()) return;

    auto& handlers = it->second;
    handlers.erase(
        std::remove_if(handlers.begin(), handlers.end(),
            [handler_id](const Handler& h) { return h.id == handler_id; }),
        handlers.end()
    );
    if (handlers.empty()) {
        m_handlers.erase(it);
    }
}

} // namespace anvil::core
