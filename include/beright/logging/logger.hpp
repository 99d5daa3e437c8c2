#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "beright/logging/log_fields.hpp"
#include "beright/logging/log_level.hpp"

namespace beright::logging
{

  /** One structured log record. ts_ms == 0 means "stamp on enqueue". */
  struct LogEvent
  {
    std::uint64_t ts_ms;
    LogLevel level;
    std::string component;
    std::string message;
    LogFields fields;
  };

  // Sink interface for log events.
  class Logger
  {
  public:
    virtual ~Logger() = default;

    // Enqueue a prebuilt event.
    virtual void log(LogEvent event) = 0;
    // Current minimum level for emission.
    [[nodiscard]] virtual LogLevel level() const = 0;

    // Convenience overload for simple messages.
    void log(LogLevel level, std::string component, std::string message)
    {
      log(LogEvent{.ts_ms = 0,
                   .level = level,
                   .component = std::move(component),
                   .message = std::move(message),
                   .fields = {}});
    }

    // Convenience overload for adding structured fields.
    void log(LogLevel level, std::string component, std::string message, LogFields fields)
    {
      log(LogEvent{.ts_ms = 0,
                   .level = level,
                   .component = std::move(component),
                   .message = std::move(message),
                   .fields = std::move(fields)});
    }
  };

  /** Logger that discards everything; used by offline CLI commands. */
  class NullLogger : public Logger
  {
  public:
    using Logger::log;

    void log(LogEvent) override {}
    [[nodiscard]] LogLevel level() const override { return LogLevel::Error; }
  };

} // namespace beright::logging
