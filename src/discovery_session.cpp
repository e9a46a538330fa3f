#include "mdns_discovery/discovery_session.hpp"
#include "mdns_discovery/log.hpp"
#include "resolution_pipeline.hpp"
#include "result_queue.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

namespace mdns_discovery
{

class DiscoverySession::SessionImpl
{
private:
	DiscoveryFilter m_filter;
	DiscoveryMode m_mode;

	std::shared_ptr<ResultQueue> m_queue;
	std::shared_ptr<ResolutionPipeline> m_pipeline;

	std::mutex m_closeMutex;
	std::unique_ptr<BrowseSubscription> m_subscription;
	std::atomic<SessionState> m_state{SessionState::Browsing};

public:
	SessionImpl(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter, DiscoveryMode mode)
	: m_filter(std::move(filter))
	, m_mode(mode)
	, m_queue(std::make_shared<ResultQueue>())
	{
		if (!browser) {
			throw std::invalid_argument("No service browser given.");
		}
		if (m_filter.service_type.empty()) {
			throw std::invalid_argument("Empty service type.");
		}

		m_pipeline = std::make_shared<ResolutionPipeline>(std::move(browser), m_queue);
		Log(LogLevel::Debug, fmt::format("Browsing for {}{}", m_filter.service_type,
			m_filter.identity ? fmt::format(" (id {})", *m_filter.identity) : std::string()));

		// Only the pipeline is captured, events keep coming until the
		// subscription is closed.
		auto pipeline = m_pipeline;
		m_subscription = pipeline->Browser().Subscribe(m_filter.service_type, [pipeline](const ServiceReference& reference) {
			pipeline->OnAdded(reference);
		});
	}

	~SessionImpl()
	{
		Close();
	}

	std::optional<ServiceRecord> Next(std::optional<Clock::time_point> deadline)
	{
		auto expected = SessionState::Matched;
		m_state.compare_exchange_strong(expected, SessionState::Browsing, std::memory_order_acq_rel);
		if (m_state.load(std::memory_order_acquire) == SessionState::Closed) {
			return std::nullopt;
		}

		while (true) {
			auto info = m_queue->Pop(deadline);
			if (!info) {
				if (!m_queue->Closed()) {
					Log(LogLevel::Debug, fmt::format("Discovery of {} timed out.", m_filter.service_type));
				}
				Close();
				return std::nullopt;
			}

			if (IsPlaceholderAddress(info->address)) {
				Log(LogLevel::Debug, fmt::format("Discarding simulator {} @ {}:{}", info->name, info->address, info->port));
				continue;
			}

			auto record = ServiceRecord::FromInfo(*info);
			if (!Matches(record)) {
				Log(LogLevel::Info, fmt::format("Discarding {} @ {}:{}", info->name, info->address, info->port));
				continue;
			}

			Log(LogLevel::Info, fmt::format("Discovered {} @ {}:{}", record.Identity(), record.Address(), record.Port()));
			expected = SessionState::Browsing;
			if (!m_state.compare_exchange_strong(expected, SessionState::Matched, std::memory_order_acq_rel)) {
				// Closed from another thread while we were matching
				return std::nullopt;
			}
			if (m_mode == DiscoveryMode::Single) {
				Close();
			}
			return record;
		}
	}

	void Close()
	{
		std::unique_ptr<BrowseSubscription> subscription;
		{
			std::lock_guard<std::mutex> lock(m_closeMutex);
			m_state.store(SessionState::Closed, std::memory_order_release);
			subscription = std::move(m_subscription);
		}
		m_queue->Close();

		if (!subscription) {
			return;
		}
		try {
			subscription->Close();
		} catch (const std::exception& e) {
			Log(LogLevel::Warn, fmt::format("Failed to close browse subscription for {}: {}", m_filter.service_type, e.what()));
		}
		Log(LogLevel::Debug, fmt::format("Stopped browsing for {}", m_filter.service_type));
	}

	[[nodiscard]] SessionState State() const
	{
		return m_state.load(std::memory_order_acquire);
	}

	[[nodiscard]] const DiscoveryFilter& Filter() const
	{
		return m_filter;
	}

private:
	bool Matches(const ServiceRecord& record) const
	{
		return !m_filter.identity || EqualsIgnoreCase(*m_filter.identity, record.Identity());
	}
};

DiscoverySession::DiscoverySession(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter, DiscoveryMode mode)
: m_impl(std::make_unique<SessionImpl>(std::move(browser), std::move(filter), mode))
{}

DiscoverySession::~DiscoverySession() = default;

std::optional<ServiceRecord> DiscoverySession::Next(std::optional<Clock::time_point> deadline)
{
	return m_impl->Next(deadline);
}

void DiscoverySession::Close()
{
	m_impl->Close();
}

void DiscoverySession::Cancel()
{
	m_impl->Close();
}

SessionState DiscoverySession::State() const
{
	return m_impl->State();
}

const DiscoveryFilter& DiscoverySession::Filter() const
{
	return m_impl->Filter();
}

}
