#pragma once

#include "mdns_discovery/types.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mdns_discovery
{

// FIFO between the resolution tasks (many producers) and the session loop
// (single consumer). Once closed it stays closed, pending items are dropped.
class ResultQueue
{
public:
    using Clock = std::chrono::steady_clock;

    // Returns false if the queue is closed and the item was dropped
    bool Push(ServiceInfo info);

    // Waits until an item is available, the deadline passes or the queue
    // is closed. Empty in the last two cases.
    std::optional<ServiceInfo> Pop(std::optional<Clock::time_point> deadline = std::nullopt);

    // Wakes all waiters
    void Close();

    [[nodiscard]] bool Closed() const;
    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::deque<ServiceInfo> m_items;
    bool m_closed{false};
};

}
