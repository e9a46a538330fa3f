#include "mdns_discovery/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace mdns_discovery
{

namespace
{

// Never destroyed, detached resolvers may still log while statics go away
std::mutex& SinkMutex()
{
    static auto* mutex = new std::mutex;
    return *mutex;
}

LogCallback& Sink()
{
    static auto* callback = new LogCallback;
    return *callback;
}

std::atomic<LogLevel> g_minLevel{LogLevel::Info};

}

std::string ToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

void SetLogCallback(LogCallback callback)
{
    std::lock_guard<std::mutex> lock(SinkMutex());
    Sink() = std::move(callback);
}

void SetLogLevel(LogLevel level)
{
    g_minLevel.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
    return g_minLevel.load(std::memory_order_relaxed);
}

void Log(LogLevel level, std::string_view string)
{
    if (level < GetLogLevel()) {
        return;
    }

    std::lock_guard<std::mutex> lock(SinkMutex());
    if (Sink()) {
        Sink()(level, string);
        return;
    }
    std::cout << string << "\n";
}

}
