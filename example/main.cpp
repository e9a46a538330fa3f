#include "mdns_discovery/discovery.hpp"
#include "mdns_discovery/log.hpp"
#include "mdns_discovery/mdns_browser.hpp"
#include "mdns_discovery/usb_devices.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{

struct Options
{
    std::string discovery{"all"};
    std::optional<std::string> id;
    std::string dns_type{mdns_discovery::kDefaultServiceType};
    std::optional<std::chrono::milliseconds> timeout;
    bool one{false};
    bool verbose{false};
};

void PrintUsage()
{
    std::cout <<
        "Usage: mdns_discovery_cli [options]\n"
        "  --discovery all|usb|wifi  Where to look for devices (default: all)\n"
        "  --id ID                   Only report the device with this id\n"
        "  --dns-type TYPE           mDNS service type (default: " << mdns_discovery::kDefaultServiceType << ")\n"
        "  --timeout SECONDS         Wifi discovery bound (default: " << mdns_discovery::kDefaultTimeout.count() << ")\n"
        "  --one                     Stop at the first wifi device, fail on timeout\n"
        "  --verbose                 Log discovery progress\n";
}

std::optional<Options> ParseArguments(int argc, char** argv)
{
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--discovery" && hasValue) {
            options.discovery = argv[++i];
            if (options.discovery != "all" && options.discovery != "usb" && options.discovery != "wifi") {
                return std::nullopt;
            }
        } else if (arg == "--id" && hasValue) {
            options.id = argv[++i];
        } else if (arg == "--dns-type" && hasValue) {
            options.dns_type = argv[++i];
        } else if (arg == "--timeout" && hasValue) {
            try {
                options.timeout = mdns_discovery::TimeoutFromSeconds(std::stod(argv[++i]));
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
            if (!options.timeout) {
                return std::nullopt;
            }
        } else if (arg == "--one") {
            options.one = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--cli") {
            // Accepted for compatibility, the tool always runs in CLI mode
        } else {
            return std::nullopt;
        }
    }
    return options;
}

void PrintUsb()
{
    for (const auto& device : mdns_discovery::ListUsbDevices()) {
        std::cout << "usb " << device.serial << " " << device.model << "\n";
    }
}

void PrintWifi(const Options& options)
{
    auto browser = std::make_shared<mdns_discovery::MdnsBrowser>();

    mdns_discovery::DiscoveryFilter filter;
    filter.identity = options.id;
    filter.service_type = options.dns_type;
    filter.timeout = options.timeout;

    if (options.one) {
        const auto record = mdns_discovery::DiscoverOne(browser, filter);
        std::cout << "wifi " << record.Identity() << " " << record.Address() << " " << record.Port() << "\n";
        return;
    }

    if (!filter.timeout) {
        filter.timeout = mdns_discovery::kDefaultTimeout;
    }
    for (const auto& record : mdns_discovery::DiscoverAll(browser, filter)) {
        std::cout << "wifi " << record.Identity() << " " << record.Address() << " " << record.Port() << std::endl;
    }
}

}

int main(int argc, char** argv)
{
    const auto options = ParseArguments(argc, argv);
    if (!options) {
        PrintUsage();
        return 1;
    }

    mdns_discovery::SetLogLevel(options->verbose ? mdns_discovery::LogLevel::Debug : mdns_discovery::LogLevel::Warn);
    mdns_discovery::SetLogCallback([](mdns_discovery::LogLevel level, std::string_view message) {
        std::cerr << "[" << mdns_discovery::ToString(level) << "] " << message << "\n";
    });

    try {
        if (options->discovery == "all" || options->discovery == "usb") {
            PrintUsb();
        }
        if (options->discovery == "all" || options->discovery == "wifi") {
            PrintWifi(*options);
        }
    } catch (const mdns_discovery::DiscoveryTimeout& e) {
        std::cerr << "Timeout: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Discovery failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
