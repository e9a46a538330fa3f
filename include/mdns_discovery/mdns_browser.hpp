#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "mdns_discovery/service_browser.hpp"

namespace mdns_discovery
{

struct MdnsBrowserSettings
{
    // How long Resolve() waits for SRV and A answers
    std::chrono::milliseconds resolve_timeout{3000};
    // First PTR re-query delay, doubled after each query up to the maximum
    std::chrono::milliseconds requery_interval{1000};
    std::chrono::milliseconds max_requery_interval{20000};
    // One socket per interface
    std::size_t max_sockets{32};
};

// ServiceBrowser on top of mdns.h, IPv4 only.
// Each subscription and each resolution opens its own client sockets.
class MdnsBrowser : public ServiceBrowser
{
public:
    MdnsBrowser(MdnsBrowserSettings settings = MdnsBrowserSettings());
    ~MdnsBrowser() override;

    // Throws std::runtime_error when no client socket could be opened
    std::unique_ptr<BrowseSubscription> Subscribe(const std::string& service_type, AddedCallback on_added) override;

    std::optional<ServiceInfo> Resolve(const ServiceReference& reference) override;

private:
    MdnsBrowserSettings m_settings;
};

}
