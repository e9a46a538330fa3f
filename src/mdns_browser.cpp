#include "mdns_discovery/mdns_browser.hpp"
#include "mdns_discovery/log.hpp"
#include "mdns_records.hpp"
#include "mdns_utils.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace mdns_discovery
{

namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::chrono::microseconds kListenSlice{100000};

// Instance names come in as the data of PTR answers for the service type
int BrowseCallback(int sock, const struct sockaddr* from, size_t addrlen,
                   mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                   uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                   size_t name_offset, size_t name_length, size_t record_offset,
                   size_t record_length, void* user_data)
{
	if (entry == MDNS_ENTRYTYPE_QUESTION || rtype != MDNS_RECORDTYPE_PTR) {
		return 0;
	}

	char namebuffer[256];
	const mdns_string_t namestr = mdns_record_parse_ptr(data, size, record_offset, record_length,
	                                                    namebuffer, sizeof(namebuffer));
	static_cast<BrowseState*>(user_data)->OnPtr(ExtractName(data, size, name_offset), ttl,
	                                             std::string(namestr.str, namestr.length));
	return 0;
}

// SRV and A records may come as answers or in the additional section
int ResolveCallback(int sock, const struct sockaddr* from, size_t addrlen,
                    mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                    uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                    size_t name_offset, size_t name_length, size_t record_offset,
                    size_t record_length, void* user_data)
{
	auto state = static_cast<ResolveState*>(user_data);
	if (entry == MDNS_ENTRYTYPE_QUESTION) {
		return 0;
	}

	if (rtype == MDNS_RECORDTYPE_SRV) {
		char namebuffer[256];
		const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		state->OnSrv(ExtractName(data, size, name_offset), std::string(srv.name.str, srv.name.length), srv.port);
	} else if (rtype == MDNS_RECORDTYPE_A) {
		struct sockaddr_in addr;
		mdns_record_parse_a(data, size, record_offset, record_length, &addr);
		addr.sin_port = 0;
		state->OnA(ExtractName(data, size, name_offset), IPV4AddressToString(&addr, sizeof(addr)));
	}
	return 0;
}

std::chrono::microseconds Remaining(Clock::time_point deadline)
{
	const auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - Clock::now());
	return std::max(left, std::chrono::microseconds(0));
}

}

class MdnsSubscription : public BrowseSubscription
{
private:
	MdnsBrowserSettings m_settings;
	ClientSockets m_sockets;
	BrowseState m_state;

	std::atomic<bool> m_running{false};
	std::thread m_listenThread;

public:
	MdnsSubscription(MdnsBrowserSettings settings, std::string service_type, ServiceBrowser::AddedCallback on_added)
	: m_settings(std::move(settings))
	, m_sockets(m_settings.max_sockets)
	{
		if (m_sockets.Empty()) {
			Log(LogLevel::Error, "Failed to open any client sockets.");
			throw std::runtime_error("Failed to open any client sockets.");
		}
		const auto num_sockets = m_sockets.Size();
		Log(LogLevel::Info, fmt::format("Opened {} socket{} for browsing {}.", num_sockets, num_sockets > 1 ? "s" : "", service_type));

		m_state.service_type = std::move(service_type);
		m_state.on_added = std::move(on_added);

		m_running.store(true, std::memory_order_release);
		m_listenThread = std::thread([this](){
			ListenLoop();
		});
	}

	~MdnsSubscription() override
	{
		Close();
	}

	void Close() override
	{
		m_running.store(false, std::memory_order_release);
		if (m_listenThread.joinable()) {
			m_listenThread.join();
		}
		if (m_sockets.Empty()) {
			return;
		}
		m_sockets.Close();
		Log(LogLevel::Debug, fmt::format("Closed browse sockets for {}.", m_state.service_type));
	}

private:
	void ListenLoop()
	{
		auto interval = m_settings.requery_interval;
		auto nextQuery = Clock::now();

		while (m_running.load(std::memory_order_acquire)) {
			const auto now = Clock::now();
			if (now >= nextQuery) {
				Log(LogLevel::Debug, fmt::format("Sending mDNS query: {} PTR", m_state.service_type));
				m_sockets.SendQuery(MDNS_RECORDTYPE_PTR, m_state.service_type);
				nextQuery = now + interval;
				interval = std::min(interval * 2, m_settings.max_requery_interval);
			}

			if (m_sockets.ReadReplies(kListenSlice, BrowseCallback, &m_state) < 0) {
				Log(LogLevel::Error, fmt::format("Waiting for mDNS replies failed: {}", strerror(errno)));
				break;
			}
		}
	}
};

MdnsBrowser::MdnsBrowser(MdnsBrowserSettings settings)
: m_settings(std::move(settings))
{}

MdnsBrowser::~MdnsBrowser() = default;

std::unique_ptr<BrowseSubscription> MdnsBrowser::Subscribe(const std::string& service_type, AddedCallback on_added)
{
	if (service_type.empty()) {
		throw std::invalid_argument("Empty service type.");
	}
	return std::make_unique<MdnsSubscription>(m_settings, service_type, std::move(on_added));
}

std::optional<ServiceInfo> MdnsBrowser::Resolve(const ServiceReference& reference)
{
	ClientSockets sockets(m_settings.max_sockets);
	if (sockets.Empty()) {
		Log(LogLevel::Warn, fmt::format("No sockets to resolve {}.", reference.instance_name));
		return std::nullopt;
	}

	ResolveState state;
	state.instance_name = reference.instance_name;

	const auto deadline = Clock::now() + m_settings.resolve_timeout;
	// Ask for the address separately once, half way, if it did not come along with the SRV answer
	const auto addressQueryAt = Clock::now() + m_settings.resolve_timeout / 2;
	bool addressQueried = false;

	sockets.SendQuery(MDNS_RECORDTYPE_SRV, state.instance_name);
	while (!state.Complete() && Clock::now() < deadline) {
		if (state.have_srv && !addressQueried && Clock::now() >= addressQueryAt) {
			sockets.SendQuery(MDNS_RECORDTYPE_A, state.target);
			addressQueried = true;
		}

		const auto slice = std::min(Remaining(deadline), kListenSlice);
		if (sockets.ReadReplies(slice, ResolveCallback, &state) < 0) {
			Log(LogLevel::Warn, fmt::format("Waiting for replies on {} failed: {}", reference.instance_name, strerror(errno)));
			return std::nullopt;
		}
	}

	auto info = state.Result();
	if (!info) {
		Log(LogLevel::Debug, fmt::format("Could not resolve {} in {} ms.", reference.instance_name, m_settings.resolve_timeout.count()));
	}
	return info;
}

}
