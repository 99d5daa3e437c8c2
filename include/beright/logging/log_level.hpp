#pragma once

#include <optional>
#include <string_view>

namespace beright::logging
{

  /** Severity, lowest first. */
  enum class LogLevel
  {
    Trace,
    Debug,
    Info,
    Warn,
    Error
  };

  // What the async logger does when its queue is full.
  enum class DropPolicy
  {
    DropOldest,
    DropNewest
  };

  /** Config word that disables the stderr echo. */
  inline constexpr std::string_view CONSOLE_OFF = "off";

  /**
   * Stderr echo setting. An empty threshold means the echo is off.
   */
  struct ConsoleEcho
  {
    std::optional<LogLevel> threshold;
  };

  [[nodiscard]] std::string_view to_string(LogLevel level);
  [[nodiscard]] std::string_view to_string(DropPolicy policy);

  /**
   * Parse a lowercase level name ("trace" .. "error").
   * @return Level, or std::nullopt for anything else.
   */
  [[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

  // "drop_oldest" or "drop_newest".
  [[nodiscard]] std::optional<DropPolicy> parse_drop_policy(std::string_view text);

  /**
   * Parse the console echo setting: a level name or "off".
   * @return Setting, or std::nullopt when the text is neither.
   */
  [[nodiscard]] std::optional<ConsoleEcho> parse_console_echo(std::string_view text);

  // True when message_level is at or above min_level.
  [[nodiscard]] bool should_log(LogLevel message_level, LogLevel min_level);

} // namespace beright::logging
