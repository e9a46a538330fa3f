#include "mdns_discovery/discovery.hpp"

#include <fmt/format.h>

#include <chrono>

namespace mdns_discovery
{

namespace
{

std::optional<DiscoverySession::Clock::time_point> DeadlineFor(const DiscoveryFilter& filter)
{
	if (!filter.timeout) {
		return std::nullopt;
	}
	const auto now = DiscoverySession::Clock::now();
	if (filter.timeout->count() <= 0) {
		return now;
	}
	// A timeout past the end of the clock means no bound
	const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(DiscoverySession::Clock::time_point::max() - now);
	if (*filter.timeout >= left) {
		return std::nullopt;
	}
	return now + *filter.timeout;
}

}

DiscoveryStream::Iterator::Iterator(DiscoveryStream* stream)
: m_stream(stream)
{
	++*this;
}

DiscoveryStream::Iterator& DiscoveryStream::Iterator::operator++()
{
	m_current = m_stream->Next();
	if (!m_current) {
		m_stream = nullptr;
	}
	return *this;
}

DiscoveryStream::DiscoveryStream(std::unique_ptr<DiscoverySession> session, std::optional<Clock::time_point> deadline)
: m_session(std::move(session))
, m_deadline(deadline)
{}

std::optional<ServiceRecord> DiscoveryStream::Next()
{
	if (!m_session) {
		return std::nullopt;
	}
	return m_session->Next(m_deadline);
}

void DiscoveryStream::Close()
{
	if (m_session) {
		m_session->Close();
	}
}

void DiscoveryStream::Cancel()
{
	if (m_session) {
		m_session->Cancel();
	}
}

bool DiscoveryStream::Closed() const
{
	return !m_session || m_session->State() == SessionState::Closed;
}

DiscoveryStream::Iterator DiscoveryStream::begin()
{
	return Iterator(this);
}

DiscoveryStream::Iterator DiscoveryStream::end()
{
	return Iterator();
}

DiscoveryStream DiscoverAll(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter)
{
	const auto deadline = DeadlineFor(filter);
	auto session = std::make_unique<DiscoverySession>(std::move(browser), std::move(filter), DiscoveryMode::All);
	return DiscoveryStream(std::move(session), deadline);
}

std::vector<ServiceRecord> CollectAll(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter)
{
	if (!filter.timeout) {
		filter.timeout = kDefaultTimeout;
	}

	std::vector<ServiceRecord> records;
	auto stream = DiscoverAll(std::move(browser), std::move(filter));
	for (const auto& record : stream) {
		records.push_back(record);
	}
	return records;
}

ServiceRecord DiscoverOne(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter)
{
	const auto deadline = DeadlineFor(filter);
	DiscoverySession session(std::move(browser), std::move(filter), DiscoveryMode::Single);

	auto record = session.Next(deadline);
	if (record) {
		return *record;
	}

	const auto& used = session.Filter();
	if (deadline && DiscoverySession::Clock::now() >= *deadline) {
		throw DiscoveryTimeout(fmt::format("No {} device{} found within {} ms",
			used.service_type,
			used.identity ? fmt::format(" with id {}", *used.identity) : std::string(),
			used.timeout->count()));
	}
	throw std::runtime_error(fmt::format("Discovery of {} closed before a device was found", used.service_type));
}

}
