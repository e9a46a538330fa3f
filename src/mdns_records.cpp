#include "mdns_records.hpp"

#include "mdns_discovery/log.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>

namespace mdns_discovery
{

bool BrowseState::OnPtr(const std::string& owner, std::uint32_t ttl, std::string instance)
{
	// ttl 0 is a goodbye
	if (ttl == 0 || instance.empty() || !EqualsIgnoreCase(owner, service_type)) {
		return false;
	}
	const auto known = std::any_of(seen.begin(), seen.end(), [&instance](const std::string& name) {
		return EqualsIgnoreCase(name, instance);
	});
	if (known) {
		return false;
	}

	Log(LogLevel::Debug, fmt::format("Instance added: {}", instance));
	seen.push_back(instance);
	try {
		on_added(ServiceReference{service_type, std::move(instance)});
	} catch (const std::exception& e) {
		Log(LogLevel::Warn, fmt::format("Added handler failed: {}", e.what()));
	}
	return true;
}

bool ResolveState::OnSrv(const std::string& owner, std::string srv_target, std::uint16_t srv_port)
{
	if (!EqualsIgnoreCase(owner, instance_name)) {
		return false;
	}
	target = std::move(srv_target);
	port = srv_port;
	have_srv = true;
	Log(LogLevel::Debug, fmt::format("{} SRV {} port {}", owner, target, port));
	return true;
}

void ResolveState::OnA(const std::string& owner, std::string address)
{
	if (address.empty()) {
		return;
	}
	Log(LogLevel::Debug, fmt::format("{} A {}", owner, address));
	addresses.emplace_back(owner, std::move(address));
}

std::optional<std::string> ResolveState::AddressOf(const std::string& host) const
{
	for (const auto& entry : addresses) {
		if (EqualsIgnoreCase(entry.first, host)) {
			return entry.second;
		}
	}
	return std::nullopt;
}

bool ResolveState::Complete() const
{
	return have_srv && AddressOf(target).has_value();
}

std::optional<ServiceInfo> ResolveState::Result() const
{
	if (!have_srv) {
		return std::nullopt;
	}
	const auto address = AddressOf(target);
	if (!address) {
		return std::nullopt;
	}

	ServiceInfo info;
	info.name = instance_name;
	info.server = target;
	info.address = *address;
	info.port = port;
	return info;
}

}
