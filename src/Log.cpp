#include "nativeudp/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

using namespace nativeudp;

namespace
{

class StderrSink final : public LogSink
{
  public:
    void write(const LogLevel level, const std::string_view tag, const std::string_view message) override
    {
        static constexpr const char* Names[] = {"DEBUG", "INFO", "WARN", "ERROR", "OFF"};
        std::cerr << "[nativeudp] " << Names[static_cast<int>(level)] << ' ' << tag << ": " << message << '\n';
    }
};

LogLevel levelFromEnvironment() noexcept
{
    const char* env = std::getenv("NATIVEUDP_LOG_LEVEL");
    return env ? parseLogLevel(env, LogLevel::Warn) : LogLevel::Warn;
}

std::atomic<LogLevel>& threshold() noexcept
{
    static std::atomic<LogLevel> level{levelFromEnvironment()};
    return level;
}

std::mutex sinkMutex;

std::shared_ptr<LogSink>& sinkSlot()
{
    static std::shared_ptr<LogSink> sink = std::make_shared<StderrSink>();
    return sink;
}

} // namespace

LogLevel nativeudp::parseLogLevel(const std::string_view name, const LogLevel fallback) noexcept
{
    std::string lower;
    lower.reserve(name.size());
    for (const char c : name)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return fallback;
}

void Log::setSink(std::shared_ptr<LogSink> sink)
{
    const std::lock_guard lock(sinkMutex);
    sinkSlot() = sink ? std::move(sink) : std::make_shared<StderrSink>();
}

void Log::setLevel(const LogLevel level) noexcept
{
    threshold().store(level, std::memory_order_relaxed);
}

LogLevel Log::level() noexcept
{
    return threshold().load(std::memory_order_relaxed);
}

bool Log::enabled(const LogLevel level) noexcept
{
    return level != LogLevel::Off && level >= Log::level();
}

void Log::write(const LogLevel level, const std::string_view tag, const std::string_view message)
{
    if (!enabled(level))
        return;

    std::shared_ptr<LogSink> sink;
    {
        const std::lock_guard lock(sinkMutex);
        sink = sinkSlot();
    }
    sink->write(level, tag, message);
}
