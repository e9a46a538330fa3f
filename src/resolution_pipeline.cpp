#include "resolution_pipeline.hpp"

#include "mdns_discovery/log.hpp"

#include <fmt/format.h>

#include <exception>
#include <system_error>
#include <thread>

namespace mdns_discovery
{

namespace
{

void ResolveInto(ServiceBrowser& browser, ResultQueue& queue, const ServiceReference& reference)
{
	std::optional<ServiceInfo> info;
	try {
		info = browser.Resolve(reference);
	} catch (const std::exception& e) {
		Log(LogLevel::Warn, fmt::format("Failed to resolve {}: {}", reference.instance_name, e.what()));
		return;
	}

	if (!info || info->address.empty()) {
		Log(LogLevel::Debug, fmt::format("No usable address for {}, dropped.", reference.instance_name));
		return;
	}

	if (!queue.Push(std::move(*info))) {
		Log(LogLevel::Debug, fmt::format("Resolved {} after the session closed.", reference.instance_name));
	}
}

}

ResolutionPipeline::ResolutionPipeline(std::shared_ptr<ServiceBrowser> browser, std::shared_ptr<ResultQueue> queue)
: m_browser(std::move(browser))
, m_queue(std::move(queue))
{}

void ResolutionPipeline::OnAdded(const ServiceReference& reference)
{
	if (m_queue->Closed()) {
		return;
	}

	Log(LogLevel::Debug, fmt::format("Resolving {}", reference.instance_name));
	try {
		std::thread([browser = m_browser, queue = m_queue, reference]() {
			ResolveInto(*browser, *queue, reference);
		}).detach();
	} catch (const std::system_error& e) {
		Log(LogLevel::Warn, fmt::format("Could not start resolving {}: {}", reference.instance_name, e.what()));
	}
}

}
