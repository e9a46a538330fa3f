#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mdns_discovery/types.hpp"

namespace mdns_discovery
{

// Handle on an active browse. Owned by exactly one discovery session.
class BrowseSubscription
{
public:
    virtual ~BrowseSubscription() = default;

    // Stops listening and releases sockets. No event is delivered after
    // this returns. Calling it again is a no-op.
    virtual void Close() = 0;
};

// The mDNS capability the discovery engine runs on.
// MdnsBrowser is the network implementation, tests provide their own.
class ServiceBrowser
{
public:
    using AddedCallback = std::function<void(const ServiceReference&)>;

    virtual ~ServiceBrowser() = default;

    // on_added is called once per newly announced instance, possibly from
    // another thread.
    virtual std::unique_ptr<BrowseSubscription> Subscribe(const std::string& service_type, AddedCallback on_added) = 0;

    // Blocking. Empty if the instance could not be resolved to an IPv4
    // address; how long to try is up to the implementation.
    virtual std::optional<ServiceInfo> Resolve(const ServiceReference& reference) = 0;
};

}
