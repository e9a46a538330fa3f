#pragma once

#include "mdns_discovery/service_browser.hpp"
#include "result_queue.hpp"

#include <memory>

namespace mdns_discovery
{

// Turns "instance added" events into resolved infos on the session queue.
// Each resolution runs on its own detached task that shares ownership of
// the browser and the queue, so closing a session never waits for them.
class ResolutionPipeline
{
public:
    ResolutionPipeline(std::shared_ptr<ServiceBrowser> browser, std::shared_ptr<ResultQueue> queue);

    // Returns immediately. Events arriving after the queue closed are ignored.
    void OnAdded(const ServiceReference& reference);

    [[nodiscard]] ServiceBrowser& Browser() const { return *m_browser; }

private:
    std::shared_ptr<ServiceBrowser> m_browser;
    std::shared_ptr<ResultQueue> m_queue;
};

}
