#pragma once

#include "mdns_discovery/service_browser.hpp"
#include "mdns_discovery/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mdns_discovery
{

// What a browse has seen so far. Fed with parsed PTR answers.
struct BrowseState
{
	std::string service_type;
	ServiceBrowser::AddedCallback on_added;
	std::vector<std::string> seen;

	// PTR answer owned by owner, pointing at instance.
	// Returns true when on_added was called for a new instance.
	bool OnPtr(const std::string& owner, std::uint32_t ttl, std::string instance);
};

// Records collected while resolving one instance
struct ResolveState
{
	std::string instance_name;
	std::string target;
	std::uint16_t port{0};
	bool have_srv{false};
	// (host name, address) pairs from A records
	std::vector<std::pair<std::string, std::string>> addresses;

	// Returns false when the record is for another instance
	bool OnSrv(const std::string& owner, std::string srv_target, std::uint16_t srv_port);
	void OnA(const std::string& owner, std::string address);

	std::optional<std::string> AddressOf(const std::string& host) const;
	bool Complete() const;
	// Empty until Complete()
	std::optional<ServiceInfo> Result() const;
};

}
