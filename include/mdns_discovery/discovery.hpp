#pragma once

#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include "mdns_discovery/discovery_session.hpp"
#include "mdns_discovery/service_browser.hpp"
#include "mdns_discovery/types.hpp"

namespace mdns_discovery
{

// DiscoverOne ran out of time before anything matched
class DiscoveryTimeout : public std::runtime_error
{
public:
    explicit DiscoveryTimeout(const std::string& what)
    : std::runtime_error(what)
    {}
};

// Lazy sequence of records from an "all matches" session, optionally bound
// by a deadline. Ends normally at the deadline. Destroying the stream
// closes the session.
class DiscoveryStream
{
public:
    using Clock = DiscoverySession::Clock;

    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ServiceRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const ServiceRecord*;
        using reference = const ServiceRecord&;

        Iterator() = default;
        explicit Iterator(DiscoveryStream* stream);

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        Iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) { return lhs.m_stream == rhs.m_stream; }
        friend bool operator!=(const Iterator& lhs, const Iterator& rhs) { return !(lhs == rhs); }

    private:
        DiscoveryStream* m_stream{nullptr};
        std::optional<ServiceRecord> m_current;
    };

    DiscoveryStream(std::unique_ptr<DiscoverySession> session, std::optional<Clock::time_point> deadline);

    DiscoveryStream(DiscoveryStream&&) noexcept = default;
    DiscoveryStream& operator=(DiscoveryStream&&) noexcept = default;

    std::optional<ServiceRecord> Next();

    void Close();
    // Safe to call from another thread while Next() blocks
    void Cancel();
    [[nodiscard]] bool Closed() const;

    [[nodiscard]] std::optional<Clock::time_point> Deadline() const { return m_deadline; }

    Iterator begin();
    Iterator end();

private:
    std::unique_ptr<DiscoverySession> m_session;
    std::optional<Clock::time_point> m_deadline;
};

// All records matching filter until filter.timeout elapses. Without a
// timeout the stream only ends when closed or cancelled.
DiscoveryStream DiscoverAll(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter);

// Drains DiscoverAll. A missing timeout means kDefaultTimeout. Possibly empty.
std::vector<ServiceRecord> CollectAll(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter);

// First record matching filter.
// Throws DiscoveryTimeout if filter.timeout elapses first. Without a
// timeout this waits for as long as it takes.
ServiceRecord DiscoverOne(std::shared_ptr<ServiceBrowser> browser, DiscoveryFilter filter);

}
