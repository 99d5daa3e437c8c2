#include "beright/logging/log_level.hpp"

#include <array>
#include <utility>

namespace beright::logging
{

  namespace
  {

    constexpr std::array<std::pair<std::string_view, LogLevel>, 5> LEVEL_NAMES{{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"error", LogLevel::Error},
    }};

  } // namespace

  std::string_view to_string(LogLevel level)
  {
    for (const auto &[name, value] : LEVEL_NAMES)
    {
      if (value == level)
      {
        return name;
      }
    }
    return "info";
  }

  std::optional<LogLevel> parse_log_level(std::string_view text)
  {
    for (const auto &[name, value] : LEVEL_NAMES)
    {
      if (name == text)
      {
        return value;
      }
    }
    return std::nullopt;
  }

  bool should_log(LogLevel message_level, LogLevel min_level)
  {
    return static_cast<int>(message_level) >= static_cast<int>(min_level);
  }

  std::string_view to_string(DropPolicy policy)
  {
    return policy == DropPolicy::DropNewest ? "drop_newest" : "drop_oldest";
  }

  std::optional<DropPolicy> parse_drop_policy(std::string_view text)
  {
    if (text == "drop_oldest")
    {
      return DropPolicy::DropOldest;
    }
    if (text == "drop_newest")
    {
      return DropPolicy::DropNewest;
    }
    return std::nullopt;
  }

  std::optional<ConsoleEcho> parse_console_echo(std::string_view text)
  {
    if (text == CONSOLE_OFF)
    {
      return ConsoleEcho{.threshold = std::nullopt};
    }
    auto level = parse_log_level(text);
    if (!level)
    {
      return std::nullopt;
    }
    return ConsoleEcho{.threshold = *level};
  }

} // namespace beright::logging
