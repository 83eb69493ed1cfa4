#ifndef SCAN_NOTIFIER_EVENT_RECEIVER_HPP
#define SCAN_NOTIFIER_EVENT_RECEIVER_HPP

#include <chrono>
#include <memory>
#include <optional>

#include "bounded_queue.hpp"
#include "event.hpp"

namespace scan_notifier {

/// Read-only end of a scanner's event queue. Copies share the same queue.
class EventReceiver {
public:
    explicit EventReceiver(std::shared_ptr<BoundedQueue<Event>> queue) : m_queue(std::move(queue)) {}

    /// @brief Wait for the next event
    /// @return nothing once the scanner has shut down and every event was consumed
    std::optional<Event> receive() { return m_queue->pop(); }

    /// @brief Wait at most timeout for the next event
    std::optional<Event> receive(std::chrono::milliseconds timeout) { return m_queue->pop(timeout); }

    std::optional<Event> tryReceive() { return m_queue->tryPop(); }

    /// @brief True when the scanner has shut down and every event was consumed
    bool closed() const { return m_queue->drained(); }

    std::size_t pending() const { return m_queue->size(); }

private:
    std::shared_ptr<BoundedQueue<Event>> m_queue;
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_EVENT_RECEIVER_HPP
