#include "result_queue.hpp"

namespace mdns_discovery
{

bool ResultQueue::Push(ServiceInfo info)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_closed) {
			return false;
		}
		m_items.push_back(std::move(info));
	}
	m_available.notify_one();
	return true;
}

std::optional<ServiceInfo> ResultQueue::Pop(std::optional<Clock::time_point> deadline)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	const auto ready = [this]() { return m_closed || !m_items.empty(); };
	if (deadline) {
		if (!m_available.wait_until(lock, *deadline, ready)) {
			return std::nullopt;
		}
	} else {
		m_available.wait(lock, ready);
	}

	if (m_closed) {
		return std::nullopt;
	}
	ServiceInfo info = std::move(m_items.front());
	m_items.pop_front();
	return info;
}

void ResultQueue::Close()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_closed = true;
		m_items.clear();
	}
	m_available.notify_all();
}

bool ResultQueue::Closed() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_closed;
}

std::size_t ResultQueue::Size() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_items.size();
}

}
