#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "mdns_discovery/service_browser.hpp"
#include "mdns_discovery/types.hpp"

namespace mdns_discovery
{

enum class DiscoveryMode {
    Single, // close after the first match
    All
};

enum class SessionState {
    Browsing,
    Matched,
    Closed
};

// One browse-and-resolve run. Subscribes on construction and releases the
// subscription on Close() or destruction, whichever comes first.
// Only Close() and Cancel() may be called from another thread than the
// one calling Next().
class DiscoverySession
{
public:
    using Clock = std::chrono::steady_clock;

    // Throws whatever the browser throws when subscribing
    DiscoverySession(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter, DiscoveryMode mode);
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    // Next record passing the filter. Empty once the deadline passed, the
    // session closed, or a single-mode session already matched.
    // Reaching the deadline closes the session.
    std::optional<ServiceRecord> Next(std::optional<Clock::time_point> deadline = std::nullopt);

    void Close();
    // Same as Close(), a blocked Next() returns empty
    void Cancel();

    [[nodiscard]] SessionState State() const;
    [[nodiscard]] const DiscoveryFilter& Filter() const;

private:
    class SessionImpl;
    std::unique_ptr<SessionImpl> m_impl;
};

}
