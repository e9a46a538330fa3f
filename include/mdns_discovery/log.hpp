#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace mdns_discovery
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};
std::string ToString(LogLevel level);

using LogCallback = std::function<void(LogLevel, std::string_view)>;

// Replaces the default sink (std::cout). Pass nullptr to restore it.
void SetLogCallback(LogCallback callback);

// Messages below this level are dropped. Default is Info.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// Thread safe, resolution tasks log from their own threads
void Log(LogLevel level, std::string_view string);

}
