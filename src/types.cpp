#include "mdns_discovery/types.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace mdns_discovery
{

bool operator==(const ServiceReference& lhs, const ServiceReference& rhs)
{
    return lhs.service_type == rhs.service_type
        && lhs.instance_name == rhs.instance_name;
}

std::ostream& operator<<(std::ostream& os, const ServiceReference& reference)
{
    os << fmt::format("{} ({})", reference.instance_name, reference.service_type);
    return os;
}

bool operator==(const ServiceInfo& lhs, const ServiceInfo& rhs)
{
    return lhs.name == rhs.name
        && lhs.server == rhs.server
        && lhs.address == rhs.address
        && lhs.port == rhs.port;
}

std::ostream& operator<<(std::ostream& os, const ServiceInfo& info)
{
    os << fmt::format("{} SRV {} @ {}:{}", info.name, info.server, info.address, info.port);
    return os;
}

ServiceRecord::ServiceRecord(std::string address, std::uint16_t port, std::string identity)
: m_address(std::move(address))
, m_port(port)
, m_identity(std::move(identity))
{}

ServiceRecord ServiceRecord::FromInfo(const ServiceInfo& info)
{
    return ServiceRecord(info.address, info.port, DeriveIdentity(info.server));
}

bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return lhs.Address() == rhs.Address()
        && lhs.Port() == rhs.Port()
        && lhs.Identity() == rhs.Identity();
}

bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << fmt::format("{} @ {}:{}", record.Identity(), record.Address(), record.Port());
    return os;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

std::string DeriveIdentity(std::string_view server)
{
    if (server.size() >= kDomainSuffix.size()
        && EqualsIgnoreCase(server.substr(server.size() - kDomainSuffix.size()), kDomainSuffix)) {
        server.remove_suffix(kDomainSuffix.size());
    }
    return std::string(server);
}

bool IsPlaceholderAddress(std::string_view address)
{
    return address == kPlaceholderAddress;
}

std::optional<std::chrono::milliseconds> TimeoutFromSeconds(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0) {
        return std::nullopt;
    }
    const double milliseconds = seconds * 1000;
    if (milliseconds >= static_cast<double>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(milliseconds));
}

}
