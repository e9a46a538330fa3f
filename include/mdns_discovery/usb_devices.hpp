#pragma once

#include <string>
#include <vector>

namespace mdns_discovery
{

inline constexpr const char* kSerialByIdDirectory{"/dev/serial/by-id"};

struct UsbDevice {
    std::string serial;
    std::string model; // "p1" or "photon", as spelled in the device name
};
bool operator==(const UsbDevice& lhs, const UsbDevice& rhs);

// Picks the devices out of serial-by-id names such as
// "usb-Particle_P1_3f002a000547343232363230-if00". Other names are skipped.
std::vector<UsbDevice> ParseUsbDevices(const std::vector<std::string>& names);

// Lists the directory and parses its entries. A missing directory means no
// devices are plugged in.
std::vector<UsbDevice> ListUsbDevices(const std::string& directory = kSerialByIdDirectory);

}
