#include "mdns_discovery/usb_devices.hpp"
#include "mdns_discovery/log.hpp"

#include <filesystem>
#include <regex>
#include <system_error>

#include <fmt/format.h>

namespace mdns_discovery
{

bool operator==(const UsbDevice& lhs, const UsbDevice& rhs)
{
    return lhs.serial == rhs.serial
        && lhs.model == rhs.model;
}

std::vector<UsbDevice> ParseUsbDevices(const std::vector<std::string>& names)
{
	static const std::regex pattern("particle_(p1|photon)_([a-z0-9]+)-", std::regex::icase);

	std::vector<UsbDevice> devices;
	for (const auto& name : names) {
		std::smatch match;
		if (std::regex_search(name, match, pattern)) {
			devices.push_back(UsbDevice{match[2].str(), match[1].str()});
		}
	}
	return devices;
}

std::vector<UsbDevice> ListUsbDevices(const std::string& directory)
{
	namespace fs = std::filesystem;

	std::error_code ec;
	if (!fs::is_directory(directory, ec)) {
		Log(LogLevel::Debug, fmt::format("{} does not exist, no USB devices.", directory));
		return {};
	}

	std::vector<std::string> names;
	for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
		names.push_back(it->path().string());
	}
	if (ec) {
		Log(LogLevel::Warn, fmt::format("Failed to list {}: {}", directory, ec.message()));
	}
	return ParseUsbDevices(names);
}

}
