#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace mdns_discovery
{

// Service type browsed when the caller does not name one
inline constexpr std::string_view kDefaultServiceType{"_brewblox._tcp.local."};
// Bound used by the "all matches" entry points when no timeout is given
inline constexpr std::chrono::seconds kDefaultTimeout{5};
// Suffix stripped from a server name to get the device identity
inline constexpr std::string_view kDomainSuffix{".local."};
// Address reported by simulated devices, never routable
inline constexpr std::string_view kPlaceholderAddress{"0.0.0.0"};

// Payload of an "instance added" event
struct ServiceReference {
    std::string service_type; // example: "_brewblox._tcp.local."
    std::string instance_name; // example: "abc123._brewblox._tcp.local."
};
bool operator==(const ServiceReference& lhs, const ServiceReference& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceReference& reference);

// Raw resolution result, before filtering
struct ServiceInfo {
    std::string name; // instance name
    std::string server; // SRV target, example: "abc123.local."
    std::string address; // dotted IPv4
    std::uint16_t port{0};
};
bool operator==(const ServiceInfo& lhs, const ServiceInfo& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceInfo& info);

class ServiceRecord
{
public:
    ServiceRecord(std::string address, std::uint16_t port, std::string identity);

    // Identity is derived from info.server
    static ServiceRecord FromInfo(const ServiceInfo& info);

    [[nodiscard]] const std::string& Address() const { return m_address; }
    [[nodiscard]] std::uint16_t Port() const { return m_port; }
    [[nodiscard]] const std::string& Identity() const { return m_identity; }

private:
    std::string m_address;
    std::uint16_t m_port;
    std::string m_identity;
};
bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs);
bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

struct DiscoveryFilter {
    std::optional<std::string> identity; // empty matches any device
    std::string service_type{kDefaultServiceType};
    std::optional<std::chrono::milliseconds> timeout; // empty waits forever
};

// "abc123.local." -> "abc123". Names without the suffix are returned as is.
std::string DeriveIdentity(std::string_view server);

bool IsPlaceholderAddress(std::string_view address);

// Timeout for a number of seconds. Empty when negative, not finite, or too
// large for milliseconds.
std::optional<std::chrono::milliseconds> TimeoutFromSeconds(double seconds);

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

}
