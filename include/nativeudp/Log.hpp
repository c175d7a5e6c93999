/**
 * @file Log.hpp
 * @brief Minimal logging facade with a pluggable sink.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace nativeudp
{

/**
 * @enum LogLevel
 * @ingroup core
 * @brief Severity of a log record. `Off` disables all output.
 */
enum class LogLevel : std::uint8_t
{
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/**
 * @class LogSink
 * @ingroup core
 * @brief Destination for log records.
 *
 * Install a custom sink with `Log::setSink()` to route transport diagnostics into the
 * application's logging system. Sinks may be called from any event-loop thread; a sink shared
 * by several loops must synchronise itself.
 */
class LogSink
{
  public:
    virtual ~LogSink() = default;

    /**
     * @brief Write one record.
     * @param level   Severity.
     * @param tag     Subsystem tag (`"socket"`, `"channel"`, `"loop"`).
     * @param message Message body, without trailing newline.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @class Log
 * @ingroup core
 * @brief Static logging facade used throughout nativeudp.
 *
 * The default sink writes `"[nativeudp] LEVEL tag: message"` lines to `std::cerr`.
 * The threshold defaults to `LogLevel::Warn` and is read once from the environment variable
 * `NATIVEUDP_LOG_LEVEL` (`debug`, `info`, `warn`, `error`, `off`) on first use;
 * `setLevel()` overrides it.
 *
 * @code
 * nativeudp::Log::setLevel(nativeudp::LogLevel::Debug);
 * nativeudp::Log::debug("channel", "bound to " + addr.toString());
 * @endcode
 */
class Log final
{
  public:
    Log() = delete;

    static void setSink(std::shared_ptr<LogSink> sink);
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void write(LogLevel level, std::string_view tag, std::string_view message);

    static void debug(const std::string_view tag, const std::string_view message)
    {
        write(LogLevel::Debug, tag, message);
    }
    static void info(const std::string_view tag, const std::string_view message)
    {
        write(LogLevel::Info, tag, message);
    }
    static void warn(const std::string_view tag, const std::string_view message)
    {
        write(LogLevel::Warn, tag, message);
    }
    static void error(const std::string_view tag, const std::string_view message)
    {
        write(LogLevel::Error, tag, message);
    }
};

/**
 * @brief Parse a level name as accepted by `NATIVEUDP_LOG_LEVEL`.
 * @ingroup core
 * @param name Case-insensitive level name.
 * @param fallback Returned when @p name is not recognised.
 */
[[nodiscard]] LogLevel parseLogLevel(std::string_view name, LogLevel fallback) noexcept;

} // namespace nativeudp
